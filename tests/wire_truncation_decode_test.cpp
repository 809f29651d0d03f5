/*
Purpose: Negative tests for wire decoding.

What this tests: Decoding functions reject truncated or malformed buffers by throwing,
so bad log, export or snapshot bytes cannot silently produce corrupted entities.
*/

#include "commit_log.hpp"
#include "snapshot.hpp"

#include <cassert>
#include <cstddef>
#include <vector>

namespace
{
    template <typename Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    std::span<const std::byte> view(const regsnap::ByteBuffer &b)
    {
        return std::span<const std::byte>(b.data(), b.size());
    }
}

int main()
{
    // Transaction: empty buffer is truncated.
    expect_throw([]
                 { (void)regsnap::decode_transaction({}); });

    regsnap::CommitLogTransaction txn;
    txn.entityGroupId = "domain/example.tld";
    txn.commitTimestamp = 1234;
    txn.mutations.push_back(regsnap::Mutation::upsert(regsnap::EntityKind::DomainBase, "example.tld", regsnap::bytes_from_string("payload")));
    txn.mutations.push_back(regsnap::Mutation::remove(regsnap::EntityKind::HostResource, "ns1.example.tld"));

    const regsnap::ByteBuffer good = regsnap::encode_transaction(txn);
    assert(regsnap::decode_transaction(view(good)) == txn);

    // Transaction: every strict prefix is rejected.
    for (std::size_t n = 0; n < good.size(); ++n)
    {
        regsnap::ByteBuffer cut(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(n));
        expect_throw([&]
                     { (void)regsnap::decode_transaction(view(cut)); });
    }

    // Transaction: trailing garbage.
    {
        regsnap::ByteBuffer extra = good;
        extra.push_back(std::byte{0});
        expect_throw([&]
                     { (void)regsnap::decode_transaction(view(extra)); });
    }

    // Transaction: mutation count far beyond the buffer.
    {
        regsnap::WireWriter w;
        w.write_string("g");
        w.write_i64(1);
        w.write_u32(0xFFFFFFFFu);
        const auto b = w.take();
        expect_throw([&]
                     { (void)regsnap::decode_transaction(view(b)); });
    }

    // Transaction: unknown mutation type, and a delete that carries a payload.
    {
        regsnap::WireWriter w;
        w.write_string("g");
        w.write_i64(1);
        w.write_u32(1);
        w.write_u32(regsnap::kind_code(regsnap::EntityKind::Cursor));
        w.write_string("c");
        w.write_u8(7);
        w.write_u8(0);
        w.write_u64(0);
        const auto b = w.take();
        expect_throw([&]
                     { (void)regsnap::decode_transaction(view(b)); });
    }
    {
        regsnap::WireWriter w;
        w.write_string("g");
        w.write_i64(1);
        w.write_u32(1);
        w.write_u32(regsnap::kind_code(regsnap::EntityKind::Cursor));
        w.write_string("c");
        w.write_u8(static_cast<std::uint8_t>(regsnap::MutationType::Delete));
        w.write_u8(1);
        w.write_string("x");
        const auto b = w.take();
        expect_throw([&]
                     { (void)regsnap::decode_transaction(view(b)); });
    }

    // Export record: truncated, and unknown kind code.
    {
        regsnap::ExportRecord rec;
        rec.kind = regsnap::EntityKind::ContactResource;
        rec.entityId = "jd1234";
        rec.payload = regsnap::bytes_from_string("John Doe");
        rec.knownAsOfTimestamp = 99;
        auto b = regsnap::encode_export_record(rec);
        assert(regsnap::decode_export_record(view(b)) == rec);
        b.resize(b.size() - 3);
        expect_throw([&]
                     { (void)regsnap::decode_export_record(view(b)); });

        regsnap::WireWriter w;
        w.write_u32(4242);
        w.write_string("x");
        w.write_string("y");
        w.write_u8(0);
        w.write_i64(0);
        const auto unknown = w.take();
        expect_throw([&]
                     { (void)regsnap::decode_export_record(view(unknown)); });
    }

    // Snapshot: truncated encoding.
    {
        regsnap::Snapshot snap(regsnap::TimeWindow{0, 10}, {regsnap::EntityKind::Registry});
        snap.put(regsnap::MaterializedEntity{regsnap::EntityKind::Registry, "tld", 5, regsnap::bytes_from_string("r")});
        auto b = snap.encode();
        assert(regsnap::Snapshot::decode(view(b)).digest() == snap.digest());
        b.pop_back();
        expect_throw([&]
                     { (void)regsnap::Snapshot::decode(view(b)); });
    }

    return 0;
}

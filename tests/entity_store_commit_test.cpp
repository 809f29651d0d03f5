/*
Purpose: Tests the live store's write path.

What this tests: commit() stamps strictly increasing per-group timestamps from the
injected clock, appends exactly what it applied, rejects malformed input and unknown
kinds without touching the log, never stamps inside the sealed range, surfaces clock
regressions beyond tolerance, and export_to() writes knownAsOf as each entity's last
write time.
*/

#include "entity_store.hpp"

#include <cassert>
#include <filesystem>
#include <thread>

namespace
{
    using regsnap::EntityKind;

    template <class E, typename Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const E &)
        {
            threw = true;
        }
        assert(threw);
    }
}

int main()
{
    regsnap::FakeClock clock(10'000);
    regsnap::TimestampAuthority authority(regsnap::TimestampAuthorityConfig{.regressionTolerance = 1000});
    regsnap::CommitLogStore log(regsnap::CommitLogStoreConfig{.bucketCount = 4, .origin = 0});
    regsnap::LiveEntityStore store(clock, authority, log);

    const auto a = store.upsert("domain/x.tld", EntityKind::DomainBase, "x.tld", regsnap::bytes_from_string("v1"));
    const auto b = store.upsert("domain/x.tld", EntityKind::DomainBase, "x.tld", regsnap::bytes_from_string("v2"));
    assert(a == 10'000 && b == 10'001);
    assert(store.get(EntityKind::DomainBase, "x.tld")->effectiveTimestamp == b);
    assert(log.transaction_count() == 2);

    // Input validation leaves the log untouched.
    expect_throw<std::invalid_argument>([&]
                                        { store.commit("domain/x.tld", {}); });
    expect_throw<std::invalid_argument>([&]
                                        { store.commit("", {regsnap::Mutation::remove(EntityKind::DomainBase, "x.tld")}); });
    {
        regsnap::Mutation m;
        m.kindCode = 999;
        m.entityId = "?";
        m.type = regsnap::MutationType::Delete;
        expect_throw<regsnap::UnknownKindError>([&]
                                                { store.commit("domain/x.tld", {m}); });
    }
    {
        regsnap::Mutation m = regsnap::Mutation::remove(EntityKind::DomainBase, "x.tld");
        m.payload = regsnap::bytes_from_string("should not be here");
        expect_throw<std::invalid_argument>([&]
                                            { store.commit("domain/x.tld", {m}); });
    }
    assert(log.transaction_count() == 2);

    // A clock far behind the group's last commit is refused; nothing is applied.
    clock.set(b - 5000);
    expect_throw<regsnap::ClockRegressionError>([&]
                                                { store.upsert("domain/x.tld", EntityKind::DomainBase, "x.tld", regsnap::bytes_from_string("late")); });
    assert(regsnap::string_from_bytes(*store.get(EntityKind::DomainBase, "x.tld")->payload) == "v2");
    assert(log.transaction_count() == 2);
    clock.set(b + 9);

    // Seal is at or after the latest commit; the next commit lands after it.
    const auto seg = store.seal_now();
    assert(seg.upper >= b);
    const auto c = store.upsert("host/ns1", EntityKind::HostResource, "ns1", regsnap::bytes_from_string("h"));
    assert(c > seg.upper);

    clock.set(c + 10);

    store.remove("domain/x.tld", EntityKind::DomainBase, "x.tld");
    assert(!store.get(EntityKind::DomainBase, "x.tld").has_value());
    assert(store.size() == 1);

    // Concurrent writers to distinct groups.
    {
        std::vector<std::thread> threads;
        for (int w = 0; w < 4; ++w)
        {
            threads.emplace_back([&store, w]
                                 {
                                     for (int i = 0; i < 50; ++i)
                                     {
                                         store.upsert("contact/" + std::to_string(w), EntityKind::ContactResource, "c" + std::to_string(w),
                                                      regsnap::bytes_from_string(std::to_string(i)));
                                     } });
        }
        for (auto &t : threads)
        {
            t.join();
        }
    }
    const auto last = store.seal_now();
    const auto txns = log.scan(std::string("contact/2"), regsnap::TimeWindow{0, last.upper});
    assert(txns.size() == 50);
    for (std::size_t i = 1; i < txns.size(); ++i)
    {
        assert(txns[i].commitTimestamp > txns[i - 1].commitTimestamp);
    }
    assert(store.size() == 5);

    // Export.
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "regsnap_entity_store_commit_test";
    fs::remove_all(dir);
    const auto manifest = store.export_to(dir, {EntityKind::ContactResource, EntityKind::HostResource},
                                          {regsnap::EntityKey{EntityKind::ContactResource, "c0"}});
    assert(manifest.exportStart <= manifest.exportCompletion);

    regsnap::DirectoryExportReader reader(dir);
    std::size_t contacts = 0;
    auto cursor = reader.read(EntityKind::ContactResource);
    while (auto rec = cursor->next())
    {
        assert(rec->entityId != "c0");
        assert(rec->knownAsOfTimestamp == store.get(EntityKind::ContactResource, rec->entityId)->effectiveTimestamp);
        ++contacts;
    }
    assert(contacts == 3);
    assert(!reader.read(EntityKind::DomainBase)->next().has_value());

    fs::remove_all(dir);
    return 0;
}

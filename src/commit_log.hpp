#pragma once

#include "entity_kind.hpp"
#include "wire.hpp"

namespace regsnap
{
    enum class MutationType : std::uint8_t
    {
        Upsert = 1,
        Delete = 2,
    };

    struct Mutation
    {
        // Raw persisted code. A log written by a newer writer may carry codes this
        // build does not know; kind() returns nullopt for those.
        std::uint32_t kindCode = 0;
        EntityIdString entityId;
        MutationType type = MutationType::Upsert;
        std::optional<ByteBuffer> payload;

        std::optional<EntityKind> kind() const noexcept { return kind_from_code(kindCode); }

        static Mutation upsert(EntityKind kind, EntityIdString id, ByteBuffer payload)
        {
            Mutation m;
            m.kindCode = kind_code(kind);
            m.entityId = std::move(id);
            m.type = MutationType::Upsert;
            m.payload = std::move(payload);
            return m;
        }

        static Mutation remove(EntityKind kind, EntityIdString id)
        {
            Mutation m;
            m.kindCode = kind_code(kind);
            m.entityId = std::move(id);
            m.type = MutationType::Delete;
            return m;
        }

        friend bool operator==(const Mutation &, const Mutation &) = default;
    };

    // Mutations committed atomically against one entity group. Identity is
    // (entityGroupId, commitTimestamp), unique because group timestamps strictly increase.
    struct CommitLogTransaction
    {
        EntityGroupId entityGroupId;
        CommitTime commitTimestamp = 0;
        std::vector<Mutation> mutations;

        friend bool operator==(const CommitLogTransaction &, const CommitLogTransaction &) = default;
    };

    struct TransactionOrder
    {
        bool operator()(const CommitLogTransaction &a, const CommitLogTransaction &b) const noexcept
        {
            if (a.commitTimestamp != b.commitTimestamp)
            {
                return a.commitTimestamp < b.commitTimestamp;
            }
            return a.entityGroupId < b.entityGroupId;
        }
    };

    inline ByteBuffer encode_transaction(const CommitLogTransaction &txn)
    {
        WireWriter w;
        w.write_string(txn.entityGroupId);
        w.write_i64(txn.commitTimestamp);
        w.write_u32(static_cast<std::uint32_t>(txn.mutations.size()));
        for (const auto &m : txn.mutations)
        {
            w.write_u32(m.kindCode);
            w.write_string(m.entityId);
            w.write_u8(static_cast<std::uint8_t>(m.type));
            w.write_u8(static_cast<std::uint8_t>(m.payload.has_value() ? 1 : 0));
            if (m.payload)
            {
                w.write_bytes(std::span<const std::byte>(m.payload->data(), m.payload->size()));
            }
        }
        return w.take();
    }

    inline CommitLogTransaction decode_transaction(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        CommitLogTransaction txn;
        txn.entityGroupId = r.read_string();
        txn.commitTimestamp = r.read_i64();
        const auto n = r.read_u32();
        // Each mutation needs at least 10 bytes; reject absurd counts before reserving.
        if (n > r.remaining() / 10)
        {
            throw std::runtime_error("decode_transaction: mutation count exceeds buffer");
        }
        txn.mutations.reserve(n);
        for (std::uint32_t i = 0; i < n; ++i)
        {
            Mutation m;
            m.kindCode = r.read_u32();
            m.entityId = r.read_string();
            const auto type = r.read_u8();
            if (type != static_cast<std::uint8_t>(MutationType::Upsert) && type != static_cast<std::uint8_t>(MutationType::Delete))
            {
                throw std::runtime_error("decode_transaction: bad mutation type");
            }
            m.type = static_cast<MutationType>(type);
            if (r.read_u8() != 0)
            {
                m.payload = r.read_bytes();
            }
            if ((m.type == MutationType::Upsert) != m.payload.has_value())
            {
                throw std::runtime_error("decode_transaction: payload presence does not match mutation type");
            }
            txn.mutations.push_back(std::move(m));
        }
        r.expect_end();
        return txn;
    }
}

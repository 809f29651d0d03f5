#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace regsnap
{
    // A commutative, multiplicity-sensitive digest over materialized entities.
    //
    // Each item contributes a 64-bit hash that is combined via both SUM and XOR, so the
    // result does not depend on how the fold was partitioned across workers or ranks.
    struct SnapshotDigest
    {
        std::uint64_t entitySum = 0;
        std::uint64_t entityXor = 0;
        std::uint64_t count = 0;

        bool operator==(const SnapshotDigest &o) const noexcept
        {
            return entitySum == o.entitySum && entityXor == o.entityXor && count == o.count;
        }

        void combine(const SnapshotDigest &o) noexcept
        {
            entitySum += o.entitySum;
            entityXor ^= o.entityXor;
            count += o.count;
        }
    };

    namespace detail
    {
        inline constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
        inline constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

        inline std::uint64_t fnv1a64(std::span<const std::byte> bytes, std::uint64_t h = kFnvOffset) noexcept
        {
            for (const std::byte b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= kFnvPrime;
            }
            return h;
        }

        inline std::uint64_t fnv1a64(std::string_view s, std::uint64_t h = kFnvOffset) noexcept
        {
            return fnv1a64(std::span<const std::byte>(reinterpret_cast<const std::byte *>(s.data()), s.size()), h);
        }

        template <class T>
        inline void append_trivial(std::vector<std::byte> &out, const T &v)
        {
            static_assert(std::is_trivially_copyable_v<T>);
            const std::size_t off = out.size();
            out.resize(off + sizeof(T));
            std::memcpy(out.data() + off, &v, sizeof(T));
        }

        inline void append_bytes(std::vector<std::byte> &out, std::span<const std::byte> b)
        {
            const std::uint64_t n = static_cast<std::uint64_t>(b.size());
            append_trivial(out, n);
            const std::size_t off = out.size();
            out.resize(off + b.size());
            if (!b.empty())
            {
                std::memcpy(out.data() + off, b.data(), b.size());
            }
        }
    }

    // Stable partition for a (kind code, entity id) key. Used both for worker
    // partitioning and MPI rank ownership, so it must never depend on process state.
    inline std::uint64_t entity_key_hash(std::uint32_t kindCode, std::string_view id) noexcept
    {
        std::vector<std::byte> buf;
        buf.reserve(4 + id.size());
        detail::append_trivial(buf, kindCode);
        const auto *p = reinterpret_cast<const std::byte *>(id.data());
        buf.insert(buf.end(), p, p + id.size());
        return detail::fnv1a64(std::span<const std::byte>(buf.data(), buf.size()));
    }
}

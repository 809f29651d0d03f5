#pragma once

#include "digest.hpp"
#include "export_reader.hpp"

#include <map>

namespace regsnap
{
    // One entity as of a reconstruction cutoff. An empty payload optional means ABSENT.
    struct MaterializedEntity
    {
        EntityKind kind = EntityKind::Registry;
        EntityIdString entityId;
        CommitTime effectiveTimestamp = kBeginningOfTime;
        std::optional<ByteBuffer> payload;

        bool absent() const noexcept { return !payload.has_value(); }

        friend bool operator==(const MaterializedEntity &, const MaterializedEntity &) = default;
    };

    namespace detail
    {
        inline std::uint64_t hash_materialized(const MaterializedEntity &e)
        {
            std::vector<std::byte> buf;
            buf.reserve(32 + e.entityId.size() + (e.payload ? e.payload->size() : 0));
            append_trivial(buf, kind_code(e.kind));
            append_bytes(buf, std::span<const std::byte>(reinterpret_cast<const std::byte *>(e.entityId.data()), e.entityId.size()));
            append_trivial(buf, e.effectiveTimestamp);
            const std::uint8_t present = e.payload ? 1u : 0u;
            append_trivial(buf, present);
            if (e.payload)
            {
                append_bytes(buf, std::span<const std::byte>(e.payload->data(), e.payload->size()));
            }
            return fnv1a64(std::span<const std::byte>(buf.data(), buf.size()));
        }
    }

    // Output of a reconstruction: per-kind collections keyed by entity id.
    //
    // Tables are ordered maps so iteration, encode() and digest() are deterministic;
    // two snapshots with the same content encode to identical bytes.
    class Snapshot
    {
    public:
        using KindTable = std::map<EntityIdString, MaterializedEntity>;

        Snapshot() = default;
        Snapshot(TimeWindow window, KindSet trackedKinds) : m_window(window), m_trackedKinds(std::move(trackedKinds)) {}

        TimeWindow window() const noexcept { return m_window; }
        CommitTime as_of() const noexcept { return m_window.end; }
        const KindSet &tracked_kinds() const noexcept { return m_trackedKinds; }

        void put(MaterializedEntity e)
        {
            auto &table = m_tables[e.kind];
            auto id = e.entityId;
            table.insert_or_assign(std::move(id), std::move(e));
        }

        const MaterializedEntity *find(EntityKind kind, std::string_view id) const
        {
            auto t = m_tables.find(kind);
            if (t == m_tables.end())
            {
                return nullptr;
            }
            auto it = t->second.find(EntityIdString(id));
            return it == t->second.end() ? nullptr : &it->second;
        }

        const KindTable &table(EntityKind kind) const
        {
            static const KindTable empty;
            auto t = m_tables.find(kind);
            return t == m_tables.end() ? empty : t->second;
        }

        std::vector<EntityKind> kinds() const
        {
            std::vector<EntityKind> out;
            for (const auto &[kind, table] : m_tables)
            {
                if (!table.empty())
                {
                    out.push_back(kind);
                }
            }
            return out;
        }

        std::size_t size() const noexcept
        {
            std::size_t n = 0;
            for (const auto &[kind, table] : m_tables)
            {
                n += table.size();
            }
            return n;
        }

        bool empty() const noexcept { return size() == 0; }

        // Union with a snapshot over a disjoint key set (a different fold partition).
        void merge_disjoint(Snapshot &&other)
        {
            for (auto &[kind, table] : other.m_tables)
            {
                auto &mine = m_tables[kind];
                for (auto &[id, e] : table)
                {
                    if (!mine.emplace(id, std::move(e)).second)
                    {
                        throw std::logic_error("Snapshot::merge_disjoint: key '" + id + "' of kind " + kind_name(kind) + " present in both partitions");
                    }
                }
            }
            other.m_tables.clear();
        }

        void drop_absent()
        {
            for (auto &[kind, table] : m_tables)
            {
                std::erase_if(table, [](const auto &kv)
                              { return kv.second.absent(); });
            }
        }

        ByteBuffer encode() const
        {
            WireWriter w;
            w.write_i64(m_window.start);
            w.write_i64(m_window.end);
            w.write_u32(static_cast<std::uint32_t>(m_trackedKinds.size()));
            for (const EntityKind k : m_trackedKinds)
            {
                w.write_u32(kind_code(k));
            }
            const auto present = kinds();
            w.write_u32(static_cast<std::uint32_t>(present.size()));
            for (const EntityKind k : present)
            {
                const auto &t = table(k);
                w.write_u32(kind_code(k));
                w.write_u32(static_cast<std::uint32_t>(t.size()));
                for (const auto &[id, e] : t)
                {
                    w.write_string(id);
                    w.write_i64(e.effectiveTimestamp);
                    w.write_u8(static_cast<std::uint8_t>(e.payload ? 1 : 0));
                    if (e.payload)
                    {
                        w.write_bytes(std::span<const std::byte>(e.payload->data(), e.payload->size()));
                    }
                }
            }
            return w.take();
        }

        static Snapshot decode(std::span<const std::byte> bytes)
        {
            WireReader r(bytes);
            TimeWindow window;
            window.start = r.read_i64();
            window.end = r.read_i64();
            KindSet tracked;
            const auto nTracked = r.read_u32();
            for (std::uint32_t i = 0; i < nTracked; ++i)
            {
                tracked.insert(decode_kind_(r.read_u32()));
            }

            Snapshot out(window, std::move(tracked));
            const auto nKinds = r.read_u32();
            for (std::uint32_t i = 0; i < nKinds; ++i)
            {
                const EntityKind kind = decode_kind_(r.read_u32());
                const auto n = r.read_u32();
                for (std::uint32_t j = 0; j < n; ++j)
                {
                    MaterializedEntity e;
                    e.kind = kind;
                    e.entityId = r.read_string();
                    e.effectiveTimestamp = r.read_i64();
                    if (r.read_u8() != 0)
                    {
                        e.payload = r.read_bytes();
                    }
                    out.put(std::move(e));
                }
            }
            r.expect_end();
            return out;
        }

        SnapshotDigest digest() const
        {
            SnapshotDigest d;
            for (const auto &[kind, table] : m_tables)
            {
                for (const auto &[id, e] : table)
                {
                    const auto h = detail::hash_materialized(e);
                    d.entitySum += h;
                    d.entityXor ^= h;
                    ++d.count;
                }
            }
            return d;
        }

    private:
        static EntityKind decode_kind_(std::uint32_t code)
        {
            const auto k = kind_from_code(code);
            if (!k)
            {
                throw std::runtime_error("Snapshot::decode: unknown kind code " + std::to_string(code));
            }
            return *k;
        }

        TimeWindow m_window{};
        KindSet m_trackedKinds;
        std::map<EntityKind, KindTable> m_tables;
    };

    // Emits a snapshot in the export layout, so it can seed a later reconstruction.
    // Each entity's knownAsOfTimestamp is its effective timestamp; ABSENT entities
    // have no export representation and are skipped.
    inline std::uint64_t write_snapshot(const std::filesystem::path &dir, const Snapshot &snapshot)
    {
        ExportManifest manifest;
        manifest.exportStart = snapshot.as_of();
        manifest.exportCompletion = snapshot.as_of();
        manifest.kinds = snapshot.tracked_kinds();
        for (const EntityKind k : snapshot.kinds())
        {
            manifest.kinds.insert(k);
        }

        ExportWriter out(dir, manifest);
        std::uint64_t written = 0;
        for (const EntityKind k : snapshot.kinds())
        {
            for (const auto &[id, e] : snapshot.table(k))
            {
                if (e.absent())
                {
                    continue;
                }
                ExportRecord rec;
                rec.kind = k;
                rec.entityId = id;
                rec.payload = *e.payload;
                if (e.effectiveTimestamp != kBeginningOfTime)
                {
                    rec.knownAsOfTimestamp = e.effectiveTimestamp;
                }
                out.write(rec);
                ++written;
            }
        }
        out.close();

        Logger::instance().logf(LogLevel::Info, "snapshot", snapshot.as_of(),
                                "wrote %llu entities to %s",
                                static_cast<unsigned long long>(written),
                                dir.string().c_str());
        return written;
    }
}

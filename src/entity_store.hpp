#pragma once

#include "clock.hpp"
#include "commit_log_files.hpp"
#include "snapshot.hpp"
#include "timestamp_authority.hpp"

#include <array>
#include <mutex>
#include <set>

namespace regsnap
{
    // The registry's live object store and its write path.
    //
    // commit() serializes per entity group (striped locks), stamps the transaction via
    // the TimestampAuthority from the injected clock, appends it to the commit log and
    // applies it to the live state. Business-logic collaborators write through here;
    // the export process dumps from here.
    class LiveEntityStore
    {
    public:
        LiveEntityStore(const IClock &clock, TimestampAuthority &authority, CommitLogStore &log)
            : m_clock(clock), m_authority(authority), m_log(log), m_sealFloor(log.sealed_through())
        {
        }

        CommitTime commit(const EntityGroupId &group, std::vector<Mutation> mutations)
        {
            if (group.empty())
            {
                throw std::invalid_argument("LiveEntityStore::commit: empty entity group id");
            }
            if (mutations.empty())
            {
                throw std::invalid_argument("LiveEntityStore::commit: no mutations");
            }
            for (const auto &m : mutations)
            {
                if (!m.kind())
                {
                    throw UnknownKindError("LiveEntityStore::commit: unknown kind code " + std::to_string(m.kindCode));
                }
                if ((m.type == MutationType::Upsert) != m.payload.has_value())
                {
                    throw std::invalid_argument("LiveEntityStore::commit: payload presence does not match mutation type");
                }
            }

            std::lock_guard<std::mutex> groupLock(stripe_(group));

            CommitTime proposed = m_clock.now();
            {
                std::lock_guard<std::mutex> lk(m_stateMu);
                if (proposed <= m_sealFloor)
                {
                    proposed = m_sealFloor + 1;
                }
            }
            const CommitTime ts = m_authority.next_timestamp(group, proposed);

            CommitLogTransaction txn;
            txn.entityGroupId = group;
            txn.commitTimestamp = ts;
            txn.mutations = std::move(mutations);
            m_log.append(txn);

            std::lock_guard<std::mutex> lk(m_stateMu);
            m_lastCommit = std::max(m_lastCommit, ts);
            for (const auto &m : txn.mutations)
            {
                EntityKey key{*m.kind(), m.entityId};
                if (m.type == MutationType::Delete)
                {
                    m_live.erase(key);
                    continue;
                }
                MaterializedEntity e;
                e.kind = key.kind;
                e.entityId = m.entityId;
                e.effectiveTimestamp = ts;
                e.payload = m.payload;
                m_live.insert_or_assign(std::move(key), std::move(e));
            }

            Logger::instance().logf(LogLevel::Trace, "store", ts, "committed %zu mutations to group %s",
                                    txn.mutations.size(), group.c_str());
            return ts;
        }

        CommitTime upsert(const EntityGroupId &group, EntityKind kind, EntityIdString id, ByteBuffer payload)
        {
            std::vector<Mutation> ms;
            ms.push_back(Mutation::upsert(kind, std::move(id), std::move(payload)));
            return commit(group, std::move(ms));
        }

        CommitTime remove(const EntityGroupId &group, EntityKind kind, EntityIdString id)
        {
            std::vector<Mutation> ms;
            ms.push_back(Mutation::remove(kind, std::move(id)));
            return commit(group, std::move(ms));
        }

        std::optional<MaterializedEntity> get(EntityKind kind, const EntityIdString &id) const
        {
            std::lock_guard<std::mutex> lk(m_stateMu);
            auto it = m_live.find(EntityKey{kind, id});
            if (it == m_live.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        // Seals the log through the current clock time with every group quiesced, so
        // no in-flight commit can land inside the sealed range. Later commits are
        // stamped after it.
        SegmentInfo seal_now(const std::optional<std::filesystem::path> &persistDir = std::nullopt)
        {
            std::array<std::unique_lock<std::mutex>, kLockStripes> locks;
            for (std::size_t i = 0; i < kLockStripes; ++i)
            {
                locks[i] = std::unique_lock<std::mutex>(m_stripes[i]);
            }

            CommitTime upTo = m_clock.now();
            {
                std::lock_guard<std::mutex> lk(m_stateMu);
                upTo = std::max({upTo, m_sealFloor, m_lastCommit, m_log.sealed_through()});
                m_sealFloor = upTo;
            }
            if (persistDir)
            {
                return seal_and_persist(*persistDir, m_log, upTo);
            }
            return m_log.seal(upTo);
        }

        // Dumps the current state of `kinds`, skipping `excluded` keys, in the export
        // layout. knownAsOfTimestamp is each entity's last write time.
        ExportManifest export_to(const std::filesystem::path &dir, const KindSet &kinds, const std::set<EntityKey> &excluded = {}) const
        {
            ExportManifest manifest;
            manifest.kinds = kinds;
            manifest.exportStart = m_clock.now();

            std::vector<ExportRecord> records;
            {
                std::lock_guard<std::mutex> lk(m_stateMu);
                for (const auto &[key, e] : m_live)
                {
                    if (kinds.count(key.kind) == 0 || excluded.count(key) != 0)
                    {
                        continue;
                    }
                    ExportRecord rec;
                    rec.kind = key.kind;
                    rec.entityId = key.id;
                    rec.payload = *e.payload;
                    rec.knownAsOfTimestamp = e.effectiveTimestamp;
                    records.push_back(std::move(rec));
                }
            }
            manifest.exportCompletion = m_clock.now();

            ExportWriter out(dir, manifest);
            for (const auto &rec : records)
            {
                out.write(rec);
            }
            out.close();

            Logger::instance().logf(LogLevel::Info, "store", manifest.exportCompletion,
                                    "exported %zu records (%zu excluded) to %s",
                                    records.size(), excluded.size(), dir.string().c_str());
            return manifest;
        }

        // Current live state as a snapshot, for comparing against reconstructions.
        Snapshot view(const KindSet &kinds) const
        {
            std::lock_guard<std::mutex> lk(m_stateMu);
            Snapshot out(TimeWindow{kBeginningOfTime, m_clock.now()}, kinds);
            for (const auto &[key, e] : m_live)
            {
                if (kinds.count(key.kind) != 0)
                {
                    out.put(e);
                }
            }
            return out;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_stateMu);
            return m_live.size();
        }

    private:
        static constexpr std::size_t kLockStripes = 32;

        std::mutex &stripe_(const EntityGroupId &group)
        {
            return m_stripes[detail::fnv1a64(std::string_view(group)) % kLockStripes];
        }

        const IClock &m_clock;
        TimestampAuthority &m_authority;
        CommitLogStore &m_log;

        std::array<std::mutex, kLockStripes> m_stripes;

        mutable std::mutex m_stateMu;
        std::map<EntityKey, MaterializedEntity> m_live;
        CommitTime m_sealFloor = kBeginningOfTime;
        CommitTime m_lastCommit = kBeginningOfTime;
    };
}

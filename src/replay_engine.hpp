#pragma once

#include "commit_log_files.hpp"
#include "commit_log_store.hpp"
#include "export_reader.hpp"
#include "snapshot.hpp"

#include <atomic>
#include <exception>
#include <thread>
#include <unordered_map>

namespace regsnap
{
    struct ReplayConfig
    {
        // Fold partitions, each folded on its own thread. 1 folds on the calling thread.
        std::size_t workerCount = 1;

        // Keep ABSENT entries (deleted as of the cutoff) in the output.
        bool retainTombstones = false;

        // Restricts this engine to keys with entity_key_hash % partitionCount ==
        // partitionIndex. Used by the MPI driver so each rank folds a disjoint share.
        std::uint32_t partitionCount = 1;
        std::uint32_t partitionIndex = 0;

        // Checked between export kinds and periodically while folding.
        const std::atomic<bool> *cancel = nullptr;

        // Sets the process-wide log level when given. Unset leaves the logger as is.
        std::optional<LogLevel> logLevel;
    };

    struct ReplayStats
    {
        std::uint64_t exportRecordsRead = 0;
        std::uint64_t exportRecordsSeeded = 0;
        std::uint64_t exportDuplicates = 0;
        std::uint64_t transactionsScanned = 0;
        std::uint64_t mutationsApplied = 0;
        std::uint64_t mutationsSuperseded = 0;
        std::uint64_t deletesApplied = 0;

        // Filtered, not failures: codes this build does not know, and known kinds that
        // were not requested.
        std::uint64_t unknownKindMutations = 0;
        std::uint64_t untrackedKindMutations = 0;

        std::uint64_t entitiesOutput = 0;
        std::uint64_t tombstonesDropped = 0;

        void add_fold(const ReplayStats &o) noexcept
        {
            mutationsApplied += o.mutationsApplied;
            mutationsSuperseded += o.mutationsSuperseded;
            deletesApplied += o.deletesApplied;
        }
    };

    // Rebuilds the exact entity-store state at a cutoff from a bulk export plus the
    // commit log window (start, end].
    //
    // Fold rule: a log mutation replaces an entity's state only if its commit time is
    // strictly later than the state's effective time, or equal to it when that state
    // came from an earlier mutation of the same transaction. Export records carry their
    // knownAsOfTimestamp (minus infinity when missing), so re-applying a mutation the
    // export already reflects is harmless.
    class ReplayEngine
    {
    public:
        explicit ReplayEngine(ReplayConfig cfg = {}) : m_cfg(cfg)
        {
            if (m_cfg.workerCount == 0)
            {
                throw std::invalid_argument("ReplayEngine: workerCount must be positive");
            }
            if (m_cfg.partitionCount == 0 || m_cfg.partitionIndex >= m_cfg.partitionCount)
            {
                throw std::invalid_argument("ReplayEngine: partitionIndex out of range");
            }

            if (m_cfg.logLevel)
            {
                Logger::instance().set_level(*m_cfg.logLevel);
            }
        }

        Snapshot reconstruct(const IExportSource &exportSource,
                             const ICommitLogSource &log,
                             TimeWindow window,
                             const KindSet &trackedKinds)
        {
            m_stats = ReplayStats{};
            validate_window_(exportSource, window);

            const std::size_t workers = m_cfg.workerCount;
            std::vector<Partition> parts(workers);

            seed_from_export_(exportSource, window, trackedKinds, parts);
            check_cancel_();

            const auto txns = log.scan(std::nullopt, window);
            m_stats.transactionsScanned = txns.size();
            check_cancel_();

            validate_transactions_(txns, window);
            route_mutations_(txns, trackedKinds, parts);

            std::vector<Snapshot> partials(workers);
            std::vector<ReplayStats> foldStats(workers);
            if (workers == 1)
            {
                partials[0] = fold_partition_(parts[0], window, trackedKinds, foldStats[0]);
            }
            else
            {
                std::vector<std::exception_ptr> errors(workers);
                std::vector<std::thread> threads;
                threads.reserve(workers);
                try
                {
                    for (std::size_t w = 0; w < workers; ++w)
                    {
                        threads.emplace_back([&, w]()
                                             {
                                                 try
                                                 {
                                                     partials[w] = fold_partition_(parts[w], window, trackedKinds, foldStats[w]);
                                                 }
                                                 catch (...)
                                                 {
                                                     errors[w] = std::current_exception();
                                                 } });
                    }
                }
                catch (...)
                {
                    // Workers already started still reference this frame.
                    for (auto &t : threads)
                    {
                        t.join();
                    }
                    throw;
                }
                for (auto &t : threads)
                {
                    t.join();
                }
                for (const auto &e : errors)
                {
                    if (e)
                    {
                        std::rethrow_exception(e);
                    }
                }
            }

            Snapshot out(window, trackedKinds);
            for (std::size_t w = 0; w < workers; ++w)
            {
                m_stats.add_fold(foldStats[w]);
                out.merge_disjoint(std::move(partials[w]));
            }

            if (!m_cfg.retainTombstones)
            {
                const std::size_t before = out.size();
                out.drop_absent();
                m_stats.tombstonesDropped = before - out.size();
            }
            m_stats.entitiesOutput = out.size();

            Logger::instance().logf(LogLevel::Info, "replay", window.end,
                                    "reconstructed %llu entities from %llu export records and %llu transactions (unknown=%llu untracked=%llu)",
                                    static_cast<unsigned long long>(m_stats.entitiesOutput),
                                    static_cast<unsigned long long>(m_stats.exportRecordsSeeded),
                                    static_cast<unsigned long long>(m_stats.transactionsScanned),
                                    static_cast<unsigned long long>(m_stats.unknownKindMutations),
                                    static_cast<unsigned long long>(m_stats.untrackedKindMutations));
            return out;
        }

        const ReplayStats &stats() const noexcept { return m_stats; }
        const ReplayConfig &config() const noexcept { return m_cfg; }

    private:
        struct FoldEntry
        {
            MaterializedEntity entity;
            bool fromLog = false;
        };

        struct FoldOp
        {
            CommitTime ts = 0;
            const CommitLogTransaction *txn = nullptr;
            std::uint32_t position = 0;
            EntityKind kind = EntityKind::Registry;
        };

        struct Partition
        {
            std::map<EntityKey, FoldEntry> state;
            std::vector<FoldOp> ops;
        };

        void check_cancel_() const
        {
            if (m_cfg.cancel && m_cfg.cancel->load(std::memory_order_relaxed))
            {
                throw ReplayCancelledError("ReplayEngine: reconstruction cancelled");
            }
        }

        void validate_window_(const IExportSource &exportSource, TimeWindow window) const
        {
            if (window.start > window.end)
            {
                throw std::invalid_argument("ReplayEngine: window start after end");
            }
            const auto manifest = exportSource.manifest();
            if (manifest && manifest->exportCompletion != kBeginningOfTime && window.start > manifest->exportCompletion)
            {
                throw WindowGapError("ReplayEngine: window starts at t=" + std::to_string(window.start) +
                                         " after export completion t=" + std::to_string(manifest->exportCompletion),
                                     window, manifest->exportCompletion, window.start);
            }
            if (manifest && manifest->exportCompletion > window.end)
            {
                throw WindowGapError("ReplayEngine: export completed at t=" + std::to_string(manifest->exportCompletion) +
                                         " after cutoff t=" + std::to_string(window.end),
                                     window, window.end, manifest->exportCompletion);
            }
        }

        // Which local partition owns a key, or nullopt if another rank owns it.
        std::optional<std::size_t> owner_(EntityKind kind, std::string_view id) const noexcept
        {
            const std::uint64_t h = entity_key_hash(kind_code(kind), id);
            if (h % m_cfg.partitionCount != m_cfg.partitionIndex)
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>((h / m_cfg.partitionCount) % m_cfg.workerCount);
        }

        // A record known as of a time after the cutoff is fatal.
        void seed_from_export_(const IExportSource &exportSource, TimeWindow window, const KindSet &trackedKinds,
                               std::vector<Partition> &parts)
        {
            for (const EntityKind kind : trackedKinds)
            {
                check_cancel_();
                auto cursor = exportSource.read(kind);
                std::uint64_t index = 0;
                while (auto rec = cursor->next())
                {
                    ++m_stats.exportRecordsRead;
                    if (rec->knownAsOfTimestamp && *rec->knownAsOfTimestamp > window.end)
                    {
                        throw CorruptExportRecordError("ReplayEngine: export record " + std::string(kind_name(kind)) + "/" + rec->entityId +
                                                           " known as of t=" + std::to_string(*rec->knownAsOfTimestamp) +
                                                           " is newer than cutoff t=" + std::to_string(window.end),
                                                       kind_name(kind), index);
                    }
                    ++index;
                    const auto w = owner_(rec->kind, rec->entityId);
                    if (!w)
                    {
                        continue;
                    }

                    FoldEntry entry;
                    entry.entity.kind = rec->kind;
                    entry.entity.entityId = rec->entityId;
                    entry.entity.effectiveTimestamp = rec->knownAsOfTimestamp.value_or(kBeginningOfTime);
                    entry.entity.payload = std::move(rec->payload);

                    auto &state = parts[*w].state;
                    EntityKey key{rec->kind, rec->entityId};
                    auto it = state.find(key);
                    if (it == state.end())
                    {
                        state.emplace(std::move(key), std::move(entry));
                        ++m_stats.exportRecordsSeeded;
                        continue;
                    }

                    ++m_stats.exportDuplicates;
                    Logger::instance().logf(LogLevel::Warn, "replay", entry.entity.effectiveTimestamp,
                                            "duplicate export record %s/%s", kind_name(kind), rec->entityId.c_str());
                    if (entry.entity.effectiveTimestamp > it->second.entity.effectiveTimestamp)
                    {
                        it->second = std::move(entry);
                    }
                }
            }
        }

        void validate_transactions_(const std::vector<CommitLogTransaction> &txns, TimeWindow window) const
        {
            std::unordered_map<EntityGroupId, CommitTime> lastByGroup;
            for (const auto &txn : txns)
            {
                if (!window.contains(txn.commitTimestamp))
                {
                    throw SnapshotError("ReplayEngine: log returned transaction at t=" + std::to_string(txn.commitTimestamp) + " outside the window");
                }
                auto [it, inserted] = lastByGroup.emplace(txn.entityGroupId, txn.commitTimestamp);
                if (!inserted)
                {
                    if (txn.commitTimestamp <= it->second)
                    {
                        throw TimestampCollisionError("ReplayEngine: group '" + txn.entityGroupId +
                                                      "' has non-increasing commit timestamps at t=" + std::to_string(txn.commitTimestamp));
                    }
                    it->second = txn.commitTimestamp;
                }
            }
        }

        void route_mutations_(const std::vector<CommitLogTransaction> &txns, const KindSet &trackedKinds, std::vector<Partition> &parts)
        {
            for (const auto &txn : txns)
            {
                for (std::uint32_t pos = 0; pos < txn.mutations.size(); ++pos)
                {
                    const Mutation &m = txn.mutations[pos];
                    const auto kind = m.kind();
                    if (!kind)
                    {
                        ++m_stats.unknownKindMutations;
                        Logger::instance().logf(LogLevel::Debug, "replay", txn.commitTimestamp,
                                                "skipping mutation of unknown kind code %u in group %s",
                                                static_cast<unsigned>(m.kindCode), txn.entityGroupId.c_str());
                        continue;
                    }
                    if (trackedKinds.count(*kind) == 0)
                    {
                        ++m_stats.untrackedKindMutations;
                        continue;
                    }
                    const auto w = owner_(*kind, m.entityId);
                    if (!w)
                    {
                        continue;
                    }
                    parts[*w].ops.push_back(FoldOp{txn.commitTimestamp, &txn, pos, *kind});
                }
            }
        }

        Snapshot fold_partition_(Partition &part, TimeWindow window, const KindSet &trackedKinds, ReplayStats &stats) const
        {
            std::stable_sort(part.ops.begin(), part.ops.end(), [](const FoldOp &a, const FoldOp &b)
                             {
                                 if (a.ts != b.ts)
                                 {
                                     return a.ts < b.ts;
                                 }
                                 if (a.txn->entityGroupId != b.txn->entityGroupId)
                                 {
                                     return a.txn->entityGroupId < b.txn->entityGroupId;
                                 }
                                 return a.position < b.position; });

            std::size_t sinceCheck = 0;
            for (const FoldOp &op : part.ops)
            {
                if (++sinceCheck == 1024)
                {
                    sinceCheck = 0;
                    check_cancel_();
                }

                const Mutation &m = op.txn->mutations[op.position];
                EntityKey key{op.kind, m.entityId};
                auto it = part.state.find(key);
                if (it != part.state.end())
                {
                    const auto &cur = it->second;
                    const bool later = op.ts > cur.entity.effectiveTimestamp;
                    const bool sameTxn = op.ts == cur.entity.effectiveTimestamp && cur.fromLog;
                    if (!later && !sameTxn)
                    {
                        ++stats.mutationsSuperseded;
                        continue;
                    }
                }

                FoldEntry next;
                next.fromLog = true;
                next.entity.kind = op.kind;
                next.entity.entityId = m.entityId;
                next.entity.effectiveTimestamp = op.ts;
                if (m.type == MutationType::Upsert)
                {
                    next.entity.payload = m.payload;
                }
                else
                {
                    ++stats.deletesApplied;
                }
                ++stats.mutationsApplied;

                if (it == part.state.end())
                {
                    part.state.emplace(std::move(key), std::move(next));
                }
                else
                {
                    it->second = std::move(next);
                }
            }

            Snapshot out(window, trackedKinds);
            for (auto &[key, entry] : part.state)
            {
                out.put(std::move(entry.entity));
            }
            part.state.clear();
            return out;
        }

        ReplayConfig m_cfg;
        ReplayStats m_stats{};
    };

    // Reconstruction entrypoint over on-disk artifacts: an export directory and a
    // commit log directory of sealed segment files.
    inline Snapshot reconstruct_from_files(const std::filesystem::path &exportDir,
                                           const std::filesystem::path &logDir,
                                           CommitTime start,
                                           CommitTime end,
                                           const KindSet &trackedKinds,
                                           ReplayConfig cfg = {},
                                           ReplayStats *statsOut = nullptr)
    {
        DirectoryExportReader exportSource(exportDir);
        const auto log = load_commit_log_dir(logDir);
        ReplayEngine engine(cfg);
        Snapshot out = engine.reconstruct(exportSource, *log, TimeWindow{start, end}, trackedKinds);
        if (statsOut)
        {
            *statsOut = engine.stats();
        }
        return out;
    }
}

#pragma once

#include "commit_log.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace regsnap
{
    class CheckpointAuthority;

    struct CommitLogStoreConfig
    {
        // Number of entity-group buckets; a group always lands in the same bucket.
        std::uint32_t bucketCount = 16;

        // Coverage starts here: the first sealed segment is (origin, upTo].
        CommitTime origin = kBeginningOfTime;
    };

    // A sealed, durable slice (lower, upper] of the log.
    struct SegmentInfo
    {
        CommitTime lower = 0;
        CommitTime upper = 0;
        std::uint64_t transactions = 0;

        TimeWindow window() const noexcept { return TimeWindow{lower, upper}; }
    };

    // Source of ordered commit-log transactions for a reconstruction window.
    class ICommitLogSource
    {
    public:
        virtual ~ICommitLogSource() = default;

        // Transactions with commitTimestamp in `window`, ascending by (commitTimestamp,
        // entityGroupId). Throws WindowGapError if the window is not fully covered.
        virtual std::vector<CommitLogTransaction> scan(const std::optional<EntityGroupId> &group, TimeWindow window) const = 0;
    };

    // Append-only store of committed transactions, bucketed by entity group.
    //
    // Appends land in the open range after the last seal. seal(upTo) makes the range
    // (lastSealed, upTo] durable and readable; scans only ever read sealed ranges, so a
    // window that reaches past the last seal is a gap rather than an empty result.
    class CommitLogStore final : public ICommitLogSource
    {
    public:
        explicit CommitLogStore(CommitLogStoreConfig cfg = {})
            : m_cfg(cfg), m_sealedThrough(cfg.origin), m_coverageStart(cfg.origin)
        {
            if (m_cfg.bucketCount == 0)
            {
                throw std::invalid_argument("CommitLogStore: bucketCount must be positive");
            }
            m_buckets.resize(m_cfg.bucketCount);
        }

        BucketId bucket_for(const EntityGroupId &group) const noexcept
        {
            return static_cast<BucketId>(detail::fnv1a64(std::string_view(group)) % m_cfg.bucketCount);
        }

        // Returns false if an identical transaction is already stored (retry no-op).
        bool append(CommitLogTransaction txn)
        {
            if (txn.entityGroupId.empty())
            {
                throw std::invalid_argument("CommitLogStore::append: empty entity group id");
            }
            if (txn.mutations.empty())
            {
                throw std::invalid_argument("CommitLogStore::append: transaction has no mutations");
            }

            std::lock_guard<std::mutex> lk(m_mu);
            auto &bucket = m_buckets[bucket_for(txn.entityGroupId)];
            const TxnKey key{txn.commitTimestamp, txn.entityGroupId};

            auto existing = bucket.find(key);
            if (existing != bucket.end())
            {
                if (existing->second == txn)
                {
                    return false;
                }
                throw TimestampCollisionError("CommitLogStore::append: group '" + txn.entityGroupId +
                                              "' already has a different transaction at t=" + std::to_string(txn.commitTimestamp));
            }

            if (txn.commitTimestamp <= m_sealedThrough)
            {
                throw SealedRangeWriteError("CommitLogStore::append: t=" + std::to_string(txn.commitTimestamp) +
                                            " is inside the sealed range ending at " + std::to_string(m_sealedThrough));
            }

            auto latest = m_groupLatest.find(txn.entityGroupId);
            if (latest != m_groupLatest.end() && txn.commitTimestamp < latest->second)
            {
                throw TimestampCollisionError("CommitLogStore::append: group '" + txn.entityGroupId +
                                              "' commit at t=" + std::to_string(txn.commitTimestamp) +
                                              " precedes its latest commit");
            }
            m_groupLatest[txn.entityGroupId] = txn.commitTimestamp;

            bucket.emplace(key, std::move(txn));
            ++m_count;
            return true;
        }

        SegmentInfo seal(CommitTime upTo)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (upTo < m_sealedThrough)
            {
                throw std::invalid_argument("CommitLogStore::seal: cannot seal backwards");
            }

            SegmentInfo seg;
            seg.lower = m_sealedThrough;
            seg.upper = upTo;
            seg.transactions = collect_(std::nullopt, seg.window()).size();
            if (upTo > m_sealedThrough)
            {
                m_segments.push_back(seg);
                m_sealedThrough = upTo;
            }

            Logger::instance().logf(LogLevel::Debug, "commitlog", upTo,
                                    "sealed segment lower=%lld transactions=%llu",
                                    static_cast<long long>(seg.lower),
                                    static_cast<unsigned long long>(seg.transactions));
            return seg;
        }

        std::vector<CommitLogTransaction> scan(const std::optional<EntityGroupId> &group, TimeWindow window) const override
        {
            if (window.start > window.end)
            {
                throw std::invalid_argument("CommitLogStore::scan: window start after end");
            }

            std::lock_guard<std::mutex> lk(m_mu);
            require_covered_(window);
            return collect_(group, window);
        }

        // Deletes transactions older than `checkpoint`. The checkpoint must already have
        // been advanced through CheckpointAuthority.
        std::uint64_t purge_before(CommitTime checkpoint)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (checkpoint > m_checkpoint)
            {
                throw CheckpointError("CommitLogStore::purge_before: t=" + std::to_string(checkpoint) +
                                      " is past the advanced checkpoint");
            }

            std::uint64_t purged = 0;
            for (auto &bucket : m_buckets)
            {
                auto end = bucket.lower_bound(TxnKey{checkpoint, EntityGroupId{}});
                for (auto it = bucket.begin(); it != end;)
                {
                    it = bucket.erase(it);
                    ++purged;
                }
            }
            m_count -= purged;

            if (checkpoint > m_coverageStart)
            {
                m_coverageStart = checkpoint;
            }
            std::erase_if(m_segments, [&](const SegmentInfo &s)
                          { return s.upper <= m_coverageStart; });
            std::erase_if(m_gaps, [&](const TimeWindow &g)
                          { return g.end <= m_coverageStart; });
            // Appends below the sealed range are rejected anyway.
            std::erase_if(m_groupLatest, [&](const auto &kv)
                          { return kv.second < checkpoint; });

            Logger::instance().logf(LogLevel::Info, "commitlog", checkpoint,
                                    "purged %llu transactions before checkpoint",
                                    static_cast<unsigned long long>(purged));
            return purged;
        }

        // Reinstalls a persisted segment. Segments must be restored in ascending order;
        // a hole between consecutive segments is remembered as a gap.
        void restore_segment(SegmentInfo seg, std::vector<CommitLogTransaction> txns)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (seg.upper < seg.lower)
            {
                throw std::invalid_argument("CommitLogStore::restore_segment: inverted bounds");
            }
            if (seg.lower < m_sealedThrough)
            {
                throw std::runtime_error("CommitLogStore::restore_segment: segment overlaps already sealed range");
            }
            if (seg.lower > m_sealedThrough)
            {
                Logger::instance().logf(LogLevel::Warn, "commitlog", seg.lower,
                                        "segment chain has a gap after t=%lld",
                                        static_cast<long long>(m_sealedThrough));
                m_gaps.push_back(TimeWindow{m_sealedThrough, seg.lower});
            }

            for (auto &txn : txns)
            {
                if (!seg.window().contains(txn.commitTimestamp))
                {
                    throw std::runtime_error("CommitLogStore::restore_segment: transaction outside segment bounds");
                }
                auto &bucket = m_buckets[bucket_for(txn.entityGroupId)];
                auto [latest, inserted] = m_groupLatest.emplace(txn.entityGroupId, txn.commitTimestamp);
                if (!inserted && txn.commitTimestamp > latest->second)
                {
                    latest->second = txn.commitTimestamp;
                }
                const TxnKey key{txn.commitTimestamp, txn.entityGroupId};
                if (!bucket.emplace(key, std::move(txn)).second)
                {
                    throw TimestampCollisionError("CommitLogStore::restore_segment: duplicate transaction identity");
                }
                ++m_count;
            }

            seg.transactions = txns.size();
            m_segments.push_back(seg);
            m_sealedThrough = seg.upper;
        }

        CommitTime sealed_through() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_sealedThrough;
        }

        // Entity groups with a retained latest commit.
        std::size_t group_count() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_groupLatest.size();
        }

        CommitTime checkpoint() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_checkpoint;
        }

        // Contiguous readable range, ignoring interior gaps.
        TimeWindow coverage() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return TimeWindow{m_coverageStart, m_sealedThrough};
        }

        std::vector<SegmentInfo> sealed_segments() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_segments;
        }

        std::uint64_t transaction_count() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_count;
        }

        const CommitLogStoreConfig &config() const noexcept { return m_cfg; }

    private:
        friend class CheckpointAuthority;

        using TxnKey = std::pair<CommitTime, EntityGroupId>;
        using Bucket = std::map<TxnKey, CommitLogTransaction>;

        void advance_checkpoint_(CommitTime ts)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (ts < m_checkpoint)
            {
                throw CheckpointError("CommitLogStore: checkpoint cannot move backwards");
            }
            if (ts > m_sealedThrough)
            {
                throw CheckpointError("CommitLogStore: checkpoint cannot pass the sealed range");
            }
            m_checkpoint = ts;
        }

        void require_covered_(TimeWindow window) const
        {
            if (window.empty())
            {
                return;
            }
            if (window.start < m_coverageStart)
            {
                throw WindowGapError("CommitLogStore: window starts before retained coverage at t=" + std::to_string(m_coverageStart),
                                     window, window.start, m_coverageStart);
            }
            if (window.end > m_sealedThrough)
            {
                throw WindowGapError("CommitLogStore: window ends after sealed coverage at t=" + std::to_string(m_sealedThrough),
                                     window, m_sealedThrough, window.end);
            }
            for (const auto &g : m_gaps)
            {
                if (g.start < window.end && g.end > window.start)
                {
                    throw WindowGapError("CommitLogStore: no stored segment covers (" + std::to_string(g.start) + ", " + std::to_string(g.end) + "]",
                                         window, g.start, g.end);
                }
            }
        }

        std::vector<CommitLogTransaction> collect_(const std::optional<EntityGroupId> &group, TimeWindow window) const
        {
            std::vector<CommitLogTransaction> out;
            if (window.empty())
            {
                return out;
            }

            const auto scan_bucket = [&](const Bucket &bucket)
            {
                for (auto it = bucket.lower_bound(TxnKey{window.start, EntityGroupId{}}); it != bucket.end(); ++it)
                {
                    if (it->first.first > window.end)
                    {
                        break;
                    }
                    if (it->first.first <= window.start)
                    {
                        continue;
                    }
                    if (group && it->second.entityGroupId != *group)
                    {
                        continue;
                    }
                    out.push_back(it->second);
                }
            };

            if (group)
            {
                scan_bucket(m_buckets[bucket_for(*group)]);
            }
            else
            {
                for (const auto &bucket : m_buckets)
                {
                    scan_bucket(bucket);
                }
                std::sort(out.begin(), out.end(), TransactionOrder{});
            }
            return out;
        }

        CommitLogStoreConfig m_cfg;

        mutable std::mutex m_mu;
        std::vector<Bucket> m_buckets;
        std::unordered_map<EntityGroupId, CommitTime> m_groupLatest;
        std::vector<SegmentInfo> m_segments;
        std::vector<TimeWindow> m_gaps;
        CommitTime m_sealedThrough = kBeginningOfTime;
        CommitTime m_coverageStart = kBeginningOfTime;
        CommitTime m_checkpoint = kBeginningOfTime;
        std::uint64_t m_count = 0;
    };
}

#pragma once

#include "errors.hpp"
#include "log.hpp"

#include <mutex>
#include <unordered_map>

namespace regsnap
{
    struct TimestampAuthorityConfig
    {
        // Largest forward correction (ms) applied silently when the proposed time is
        // not after the group's last commit. Larger corrections mean the upstream
        // clock regressed and are rejected.
        CommitTime regressionTolerance = 5000;
    };

    // Issues strictly increasing commit timestamps per entity group.
    //
    // Callers must serialize commits to the same group (the write path holds the
    // group's lock across next_timestamp() and the log append) so that accepted values
    // are observed in commit order. Different groups need no coordination.
    class TimestampAuthority
    {
    public:
        explicit TimestampAuthority(TimestampAuthorityConfig cfg = {}) : m_cfg(cfg)
        {
            if (m_cfg.regressionTolerance < 0)
            {
                throw std::invalid_argument("TimestampAuthority: negative regression tolerance");
            }
        }

        CommitTime next_timestamp(const EntityGroupId &group, CommitTime proposed)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_last.find(group);
            if (it == m_last.end())
            {
                m_last.emplace(group, proposed);
                return proposed;
            }

            const CommitTime last = it->second;
            if (proposed > last)
            {
                it->second = proposed;
                return proposed;
            }

            if (last == kEndOfTime)
            {
                throw TimestampCollisionError("TimestampAuthority: group '" + group + "' has exhausted its timestamp range");
            }

            const CommitTime corrected = last + 1;
            // corrected - proposed can overflow when proposed is near kBeginningOfTime.
            const bool overflow = proposed < 0 && corrected > kEndOfTime + proposed;
            if (overflow || corrected - proposed > m_cfg.regressionTolerance)
            {
                Logger::instance().logf(LogLevel::Error, "timestamp", proposed,
                                        "clock regression in group %s: last=%lld tolerance=%lld",
                                        group.c_str(),
                                        static_cast<long long>(last),
                                        static_cast<long long>(m_cfg.regressionTolerance));
                throw ClockRegressionError("TimestampAuthority: clock regression beyond tolerance in group '" + group + "'",
                                           group, proposed, last);
            }

            Logger::instance().logf(LogLevel::Debug, "timestamp", corrected,
                                    "group %s proposed %lld, advanced past last commit",
                                    group.c_str(), static_cast<long long>(proposed));
            it->second = corrected;
            ++m_corrections;
            return corrected;
        }

        // Raises the group's last accepted timestamp to at least `ts`, e.g. when
        // recovering the write path from a persisted log.
        void observe(const EntityGroupId &group, CommitTime ts)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto [it, inserted] = m_last.emplace(group, ts);
            if (!inserted && ts > it->second)
            {
                it->second = ts;
            }
        }

        std::optional<CommitTime> last_accepted(const EntityGroupId &group) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_last.find(group);
            if (it == m_last.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::uint64_t corrections() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_corrections;
        }

        const TimestampAuthorityConfig &config() const noexcept { return m_cfg; }

    private:
        TimestampAuthorityConfig m_cfg;

        mutable std::mutex m_mu;
        std::unordered_map<EntityGroupId, CommitTime> m_last;
        std::uint64_t m_corrections = 0;
    };
}

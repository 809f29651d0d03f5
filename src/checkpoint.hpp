#pragma once

#include "commit_log_store.hpp"

#include <map>
#include <mutex>
#include <string>

namespace regsnap
{
    // The only path that may advance a CommitLogStore checkpoint.
    //
    // Each consumer of old log data (replay windows, backups) registers and later
    // confirms the instant before which it will never read again. The checkpoint may
    // only move to a time every registered consumer has confirmed.
    class CheckpointAuthority
    {
    public:
        // `needsFrom` is the oldest instant the consumer may still read after; its
        // confirmation starts there.
        void register_consumer(const std::string &name, CommitTime needsFrom)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_confirmed.emplace(name, needsFrom).second)
            {
                throw std::invalid_argument("CheckpointAuthority: consumer '" + name + "' already registered");
            }
        }

        void unregister_consumer(const std::string &name)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_confirmed.erase(name) == 0)
            {
                throw std::invalid_argument("CheckpointAuthority: unknown consumer '" + name + "'");
            }
        }

        // Consumer promises never to read data older than `safeBefore`. Monotonic.
        void confirm(const std::string &name, CommitTime safeBefore)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_confirmed.find(name);
            if (it == m_confirmed.end())
            {
                throw std::invalid_argument("CheckpointAuthority: unknown consumer '" + name + "'");
            }
            if (safeBefore > it->second)
            {
                it->second = safeBefore;
            }
        }

        // Minimum confirmation over all consumers; nullopt when none are registered,
        // since with no known consumers nothing has been confirmed.
        std::optional<CommitTime> safe_checkpoint() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return safe_checkpoint_();
        }

        void advance(CommitLogStore &store, CommitTime ts)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            const auto safe = safe_checkpoint_();
            if (!safe)
            {
                throw CheckpointError("CheckpointAuthority: no registered consumers have confirmed");
            }
            if (ts > *safe)
            {
                std::string lagging;
                for (const auto &[name, confirmed] : m_confirmed)
                {
                    if (confirmed < ts)
                    {
                        lagging = name;
                        break;
                    }
                }
                throw CheckpointError("CheckpointAuthority: consumer '" + lagging + "' has not confirmed t=" + std::to_string(ts));
            }
            store.advance_checkpoint_(ts);
            Logger::instance().logf(LogLevel::Info, "checkpoint", ts, "checkpoint advanced");
        }

        std::size_t consumer_count() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_confirmed.size();
        }

    private:
        std::optional<CommitTime> safe_checkpoint_() const
        {
            if (m_confirmed.empty())
            {
                return std::nullopt;
            }
            CommitTime out = kEndOfTime;
            for (const auto &[name, confirmed] : m_confirmed)
            {
                out = std::min(out, confirmed);
            }
            return out;
        }

        mutable std::mutex m_mu;
        std::map<std::string, CommitTime> m_confirmed;
    };
}

#pragma once

#include "common.hpp"

#include <atomic>
#include <chrono>

namespace regsnap
{
    // Source of wall-clock commit times. Passed explicitly to the write path so
    // tests can drive time deterministically.
    class IClock
    {
    public:
        virtual ~IClock() = default;
        virtual CommitTime now() const = 0;
    };

    class SystemClock final : public IClock
    {
    public:
        CommitTime now() const override
        {
            const auto since = std::chrono::system_clock::now().time_since_epoch();
            return static_cast<CommitTime>(std::chrono::duration_cast<std::chrono::milliseconds>(since).count());
        }
    };

    // Manually driven clock. Thread-safe; may be moved backwards to simulate a
    // misbehaving time source.
    class FakeClock final : public IClock
    {
    public:
        explicit FakeClock(CommitTime start = 0) : m_now(start) {}

        CommitTime now() const override { return m_now.load(std::memory_order_acquire); }

        void set(CommitTime t) { m_now.store(t, std::memory_order_release); }

        void advance(CommitTime delta) { m_now.fetch_add(delta, std::memory_order_acq_rel); }

        void advance_one_milli() { advance(1); }

    private:
        std::atomic<CommitTime> m_now;
    };
}

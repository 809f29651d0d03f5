#pragma once

#include "common.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace regsnap
{
    // Base of every failure raised by the snapshot core. Fatal kinds abort a
    // reconstruction call without returning any partial result.
    class SnapshotError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The requested log window is not fully covered by sealed, retained segments.
    class WindowGapError final : public SnapshotError
    {
    public:
        WindowGapError(const std::string &what, TimeWindow requested, CommitTime gapStart, CommitTime gapEnd)
            : SnapshotError(what), m_requested(requested), m_gapStart(gapStart), m_gapEnd(gapEnd)
        {
        }

        TimeWindow requested() const noexcept { return m_requested; }
        CommitTime gap_start() const noexcept { return m_gapStart; }
        CommitTime gap_end() const noexcept { return m_gapEnd; }

    private:
        TimeWindow m_requested{};
        CommitTime m_gapStart = 0;
        CommitTime m_gapEnd = 0;
    };

    // A group's clock moved backward by more than the configured tolerance.
    class ClockRegressionError final : public SnapshotError
    {
    public:
        ClockRegressionError(const std::string &what, EntityGroupId group, CommitTime proposed, CommitTime lastAccepted)
            : SnapshotError(what), m_group(std::move(group)), m_proposed(proposed), m_lastAccepted(lastAccepted)
        {
        }

        const EntityGroupId &group() const noexcept { return m_group; }
        CommitTime proposed() const noexcept { return m_proposed; }
        CommitTime last_accepted() const noexcept { return m_lastAccepted; }

    private:
        EntityGroupId m_group;
        CommitTime m_proposed = 0;
        CommitTime m_lastAccepted = 0;
    };

    class TimestampCollisionError final : public SnapshotError
    {
    public:
        using SnapshotError::SnapshotError;
    };

    // Raised by strict kind lookups. Replay filters unknown kinds instead of throwing.
    class UnknownKindError final : public SnapshotError
    {
    public:
        using SnapshotError::SnapshotError;
    };

    class CorruptExportRecordError final : public SnapshotError
    {
    public:
        CorruptExportRecordError(const std::string &what, std::string source, std::uint64_t recordIndex)
            : SnapshotError(what), m_source(std::move(source)), m_recordIndex(recordIndex)
        {
        }

        const std::string &source() const noexcept { return m_source; }
        std::uint64_t record_index() const noexcept { return m_recordIndex; }

    private:
        std::string m_source;
        std::uint64_t m_recordIndex = 0;
    };

    // Write attempted into a commit-time range that has already been sealed durable.
    class SealedRangeWriteError final : public SnapshotError
    {
    public:
        using SnapshotError::SnapshotError;
    };

    class CheckpointError final : public SnapshotError
    {
    public:
        using SnapshotError::SnapshotError;
    };

    // A framed record file failed its header, framing or checksum validation.
    class RecordFileError final : public SnapshotError
    {
    public:
        RecordFileError(const std::string &what, std::string path, std::uint64_t recordIndex)
            : SnapshotError(what), m_path(std::move(path)), m_recordIndex(recordIndex)
        {
        }

        const std::string &path() const noexcept { return m_path; }
        std::uint64_t record_index() const noexcept { return m_recordIndex; }

    private:
        std::string m_path;
        std::uint64_t m_recordIndex = 0;
    };

    class ReplayCancelledError final : public SnapshotError
    {
    public:
        using SnapshotError::SnapshotError;
    };
}

#pragma once

#include "commit_log_store.hpp"
#include "record_file.hpp"

#include <charconv>
#include <filesystem>
#include <memory>

namespace regsnap
{
    inline constexpr std::string_view kSegmentFilePrefix = "commit_diff_until_";
    inline constexpr std::string_view kSegmentFileSuffix = ".log";

    inline std::string segment_file_name(CommitTime upper)
    {
        return std::string(kSegmentFilePrefix) + std::to_string(upper) + std::string(kSegmentFileSuffix);
    }

    // Parses the upper bound back out of a segment file name.
    inline std::optional<CommitTime> parse_segment_file_name(std::string_view name)
    {
        if (!name.starts_with(kSegmentFilePrefix) || !name.ends_with(kSegmentFileSuffix))
        {
            return std::nullopt;
        }
        name.remove_prefix(kSegmentFilePrefix.size());
        name.remove_suffix(kSegmentFileSuffix.size());
        CommitTime v = 0;
        auto r = std::from_chars(name.data(), name.data() + name.size(), v);
        if (r.ec != std::errc() || r.ptr != name.data() + name.size())
        {
            return std::nullopt;
        }
        return v;
    }

    // Writes the transactions of an already sealed segment to <dir>/commit_diff_until_<upper>.log.
    inline std::filesystem::path persist_segment(const std::filesystem::path &dir, const CommitLogStore &store, const SegmentInfo &seg)
    {
        std::filesystem::create_directories(dir);

        const auto txns = store.scan(std::nullopt, seg.window());

        WireWriter h;
        h.write_i64(seg.lower);
        h.write_i64(seg.upper);
        h.write_u64(static_cast<std::uint64_t>(txns.size()));
        const auto header = h.take();

        const auto path = dir / segment_file_name(seg.upper);
        RecordFileWriter out(path.string(), RecordFileKind::CommitLogSegment, header);
        for (const auto &txn : txns)
        {
            const auto body = encode_transaction(txn);
            out.append(body);
        }
        out.close();

        Logger::instance().logf(LogLevel::Info, "commitlog", seg.upper,
                                "persisted %llu transactions to %s",
                                static_cast<unsigned long long>(txns.size()),
                                path.string().c_str());
        return path;
    }

    // Seals (lastSealed, upTo] and persists it.
    inline SegmentInfo seal_and_persist(const std::filesystem::path &dir, CommitLogStore &store, CommitTime upTo)
    {
        const SegmentInfo seg = store.seal(upTo);
        if (seg.upper > seg.lower)
        {
            persist_segment(dir, store, seg);
        }
        return seg;
    }

    struct LoadedSegment
    {
        SegmentInfo info;
        std::vector<CommitLogTransaction> transactions;
    };

    inline LoadedSegment load_segment_file(const std::filesystem::path &path)
    {
        RecordFileReader in(path.string(), RecordFileKind::CommitLogSegment);

        LoadedSegment seg;
        std::uint64_t expected = 0;
        try
        {
            WireReader h(in.header());
            seg.info.lower = h.read_i64();
            seg.info.upper = h.read_i64();
            expected = h.read_u64();
            h.expect_end();
        }
        catch (const std::runtime_error &e)
        {
            throw RecordFileError("load_segment_file: bad segment header in " + path.string() + ": " + e.what(), path.string(), 0);
        }

        while (auto body = in.next())
        {
            const auto index = in.next_index() - 1;
            try
            {
                seg.transactions.push_back(decode_transaction(std::span<const std::byte>(body->data(), body->size())));
            }
            catch (const RecordFileError &)
            {
                throw;
            }
            catch (const std::runtime_error &e)
            {
                throw RecordFileError("load_segment_file: undecodable transaction in " + path.string() + ": " + e.what(),
                                      path.string(), index);
            }
        }

        if (seg.transactions.size() != expected)
        {
            throw RecordFileError("load_segment_file: transaction count does not match header in " + path.string(),
                                  path.string(), seg.transactions.size());
        }
        seg.info.transactions = expected;
        return seg;
    }

    // Rebuilds a store from every segment file in `dir`. The store's coverage starts at
    // the lower bound of the earliest segment; holes between segments become gaps that
    // fail any scan crossing them.
    inline std::unique_ptr<CommitLogStore> load_commit_log_dir(const std::filesystem::path &dir, std::uint32_t bucketCount = 16)
    {
        if (!std::filesystem::is_directory(dir))
        {
            throw std::runtime_error("load_commit_log_dir: not a directory: " + dir.string());
        }

        std::vector<std::pair<CommitTime, std::filesystem::path>> files;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            const auto upper = parse_segment_file_name(entry.path().filename().string());
            if (upper)
            {
                files.emplace_back(*upper, entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        std::vector<LoadedSegment> segments;
        segments.reserve(files.size());
        for (const auto &[upper, path] : files)
        {
            auto seg = load_segment_file(path);
            if (seg.info.upper != upper)
            {
                throw RecordFileError("load_commit_log_dir: header upper bound disagrees with file name " + path.string(),
                                      path.string(), 0);
            }
            segments.push_back(std::move(seg));
        }

        CommitLogStoreConfig cfg;
        cfg.bucketCount = bucketCount;
        cfg.origin = segments.empty() ? kBeginningOfTime : segments.front().info.lower;

        auto store = std::make_unique<CommitLogStore>(cfg);
        for (auto &seg : segments)
        {
            store->restore_segment(seg.info, std::move(seg.transactions));
        }

        Logger::instance().logf(LogLevel::Info, "commitlog", store->sealed_through(),
                                "loaded %zu segments (%llu transactions) from %s",
                                segments.size(),
                                static_cast<unsigned long long>(store->transaction_count()),
                                dir.string().c_str());
        return store;
    }
}

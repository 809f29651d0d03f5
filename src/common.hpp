#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace regsnap
{
    // Milliseconds since the Unix epoch.
    using CommitTime = std::int64_t;

    // Stands for "minus infinity": older than any real commit.
    inline constexpr CommitTime kBeginningOfTime = std::numeric_limits<CommitTime>::min();
    inline constexpr CommitTime kEndOfTime = std::numeric_limits<CommitTime>::max();

    using EntityGroupId = std::string;
    using EntityIdString = std::string;
    using BucketId = std::uint32_t;

    using ByteBuffer = std::vector<std::byte>;

    // Half-open commit-time window (start, end].
    struct TimeWindow
    {
        CommitTime start = kBeginningOfTime;
        CommitTime end = kBeginningOfTime;

        bool contains(CommitTime t) const noexcept { return t > start && t <= end; }
        bool empty() const noexcept { return end <= start; }

        friend bool operator==(const TimeWindow &, const TimeWindow &) = default;
    };

    inline ByteBuffer bytes_from_string(std::string_view s)
    {
        ByteBuffer out(s.size());
        if (!s.empty())
        {
            std::memcpy(out.data(), s.data(), s.size());
        }
        return out;
    }

    inline std::string string_from_bytes(std::span<const std::byte> b)
    {
        return std::string(reinterpret_cast<const char *>(b.data()), b.size());
    }

    template <class T>
    inline ByteBuffer bytes_from_trivially_copyable(const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        ByteBuffer out(sizeof(T));
        std::memcpy(out.data(), &value, sizeof(T));
        return out;
    }
}

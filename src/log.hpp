#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace regsnap
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        if (s == "error")
        {
            return LogLevel::Error;
        }
        if (s == "warn")
        {
            return LogLevel::Warn;
        }
        if (s == "info")
        {
            return LogLevel::Info;
        }
        if (s == "debug")
        {
            return LogLevel::Debug;
        }
        if (s == "trace")
        {
            return LogLevel::Trace;
        }
        if (s == "off")
        {
            return LogLevel::Off;
        }
        return std::nullopt;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const noexcept { return m_level; }

        bool enabled(LogLevel lvl) const noexcept { return log_enabled(m_level, lvl); }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // `ts` is the commit time the message is about, or kBeginningOfTime if none.
        void logf(LogLevel lvl, const char *component, CommitTime ts, const char *fmt, ...)
        {
            if (!log_enabled(m_level, lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            if (ts == kBeginningOfTime)
            {
                std::fprintf(m_sink, "[%s][%s][t=-inf] %s\n", log_level_name(lvl), component, buf);
            }
            else
            {
                std::fprintf(m_sink, "[%s][%s][t=%lld] %s\n",
                             log_level_name(lvl),
                             component,
                             static_cast<long long>(ts),
                             buf);
            }
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };
}

#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string_view>

namespace tickback
{
    // Lower value = more severe. Off silences everything.
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

    // Accepts the lower-case names used on command lines ("warn", "debug", ...).
    inline bool parse_log_level(std::string_view s, LogLevel &out) noexcept
    {
        static constexpr LogLevel kAll[] = {LogLevel::Error, LogLevel::Warn, LogLevel::Info,
                                            LogLevel::Debug, LogLevel::Trace, LogLevel::Off};
        for (const LogLevel lvl : kAll)
        {
            const std::string_view name = log_level_name(lvl);
            if (name.size() != s.size())
            {
                continue;
            }
            bool same = true;
            for (std::size_t i = 0; i < s.size() && same; ++i)
            {
                const char c = s[i];
                same = (c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c) == name[i];
            }
            if (same)
            {
                out = lvl;
                return true;
            }
        }
        return false;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off || msg == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Process-wide logger shared by every controller and session. Each line is tagged
    // with the peer, entity and tick it refers to, so the client and server halves of a
    // loopback run can be told apart in one stream:
    //
    //   [WARN][peer=0][entity=1][tick=412] packet dropped, simulating default input
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

        // nullptr discards output. The logger never closes the sink.
        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        void logf(LogLevel lvl, PeerId peer, EntityId entity, Tick tick, const char *fmt, ...)
        {
            if (!enabled(lvl))
            {
                return;
            }

            char msg[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(msg, sizeof(msg), fmt, args);
            va_end(args);

            write_line_(lvl, peer, entity, tick, msg);
        }

    private:
        Logger() = default;

        void write_line_(LogLevel lvl, PeerId peer, EntityId entity, Tick tick, const char *msg)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            std::fprintf(m_sink, "[%s][peer=%u][entity=%llu][tick=%llu] %s\n",
                         log_level_name(lvl),
                         static_cast<unsigned>(peer),
                         static_cast<unsigned long long>(entity),
                         static_cast<unsigned long long>(tick),
                         msg);
            std::fflush(m_sink);
        }

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };

    // Raises or lowers the process-wide level for a scope, restoring the previous one.
    class ScopedLogLevel
    {
    public:
        explicit ScopedLogLevel(LogLevel lvl) : m_previous(Logger::instance().level())
        {
            Logger::instance().set_level(lvl);
        }

        ~ScopedLogLevel() { Logger::instance().set_level(m_previous); }

        ScopedLogLevel(const ScopedLogLevel &) = delete;
        ScopedLogLevel &operator=(const ScopedLogLevel &) = delete;

    private:
        LogLevel m_previous;
    };
}

// utils/logging.hpp
#pragma once
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>

namespace utils
{

    enum class LogLevel : int
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    inline const char *to_string(LogLevel lvl)
    {
        static const char *names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
        const int i = static_cast<int>(lvl);
        return (i >= 0 && i <= 5) ? names[i] : "OFF";
    }

    /**
     * Parse a level name as written in YAML or on the command line
     * ("trace", "debug", "info", "warn"/"warning", "error", "off").
     * Returns false and leaves `out` untouched for unknown names.
     */
    inline bool parse_level(const std::string &name, LogLevel &out)
    {
        struct Entry { const char *name; LogLevel lvl; };
        static const Entry table[] = {
            {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
            {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
            {"off", LogLevel::Off},     {"none", LogLevel::Off},
        };

        std::string v;
        v.reserve(name.size());
        for (char c : name)
            v.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));

        for (const auto &e : table)
        {
            if (v == e.name)
            {
                out = e.lvl;
                return true;
            }
        }
        return false;
    }

    // ========================================================================
    // Shared logger state
    // ========================================================================

    struct LogState
    {
        LogLevel level = LogLevel::Info;
        std::ofstream file;
        double sim_time_s = NAN;   // NaN: no episode running, stamp omitted
        std::mutex mtx;            // transport callbacks may log from other threads
    };

    inline LogState &log_state()
    {
        static LogState s;
        return s;
    }

    inline void set_level(LogLevel lvl)
    {
        log_state().level = lvl;
    }

    inline LogLevel level()
    {
        return log_state().level;
    }

    inline bool enabled(LogLevel lvl)
    {
        const LogLevel cur = log_state().level;
        return cur != LogLevel::Off && lvl >= cur;
    }

    /// Simulation time shown next to the wall clock in every line
    inline void set_sim_time(double t_s)
    {
        log_state().sim_time_s = t_s;
    }

    inline void clear_sim_time()
    {
        log_state().sim_time_s = NAN;
    }

    /**
     * Mirror log output into `path` (truncated). stderr output continues.
     * Returns false if the file cannot be opened.
     */
    inline bool open_log_file(const std::string &path)
    {
        auto &s = log_state();
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.file.is_open())
            s.file.close();

        s.file.open(path, std::ios::out | std::ios::trunc);
        if (!s.file.is_open())
        {
            std::fprintf(stderr, "[ERROR] Cannot open log file: %s\n", path.c_str());
            return false;
        }
        return true;
    }

    inline void close_log_file()
    {
        auto &s = log_state();
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.file.is_open())
            s.file.close();
    }

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        if (!enabled(lvl))
            return;

        std::time_t now = std::time(nullptr);
        std::tm tm{};
        localtime_r(&now, &tm);

        char stamp[64];
        const double t_sim = log_state().sim_time_s;
        if (std::isnan(t_sim))
            std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
        else
            std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d t=%.3f", tm.tm_hour, tm.tm_min, tm.tm_sec, t_sim);

        char msg[1024];
        std::vsnprintf(msg, sizeof(msg), fmt, args);

        char line[1200];
        std::snprintf(line, sizeof(line), "[%s] %-5s: %s\n", stamp, to_string(lvl), msg);

        auto &s = log_state();
        std::lock_guard<std::mutex> lock(s.mtx);
        std::fputs(line, stderr);
        if (s.file.is_open())
        {
            s.file << line;
            s.file.flush();
        }
    }

    inline void logf(LogLevel lvl, const char *fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        vlogf(lvl, fmt, args);
        va_end(args);
    }

} // namespace utils

#define LOG_TRACE(...) ::utils::logf(::utils::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::utils::logf(::utils::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::utils::logf(::utils::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ::utils::logf(::utils::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::utils::logf(::utils::LogLevel::Error, __VA_ARGS__)

// utils/logging.hpp
#pragma once
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>
#include <sys/time.h>

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
        switch (lvl)
        {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "OFF";
        }
    }

    // Case-insensitive; "warning" and "none" are accepted as aliases.
    inline bool parse_level(const std::string &s, LogLevel &out)
    {
        static const struct
        {
            const char *name;
            LogLevel lvl;
        } table[] = {
            {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
            {"warn", LogLevel::Warn},   {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
            {"off", LogLevel::Off},     {"none", LogLevel::Off},
        };

        std::string v;
        v.reserve(s.size());
        for (char c : s)
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

    // Process-wide sink: stderr always, plus an optional append-mode file.
    struct LogSink
    {
        std::mutex mtx;
        LogLevel level = LogLevel::Info;
        std::ofstream file;
        std::string file_path;
    };

    inline LogSink &log_sink()
    {
        static LogSink sink;
        return sink;
    }

    // Source id of the CAN stream being processed on this thread ("" = none)
    inline std::string &log_source()
    {
        thread_local std::string src;
        return src;
    }

    inline void set_level(LogLevel lvl)
    {
        std::lock_guard<std::mutex> lock(log_sink().mtx);
        log_sink().level = lvl;
    }

    inline LogLevel level()
    {
        std::lock_guard<std::mutex> lock(log_sink().mtx);
        return log_sink().level;
    }

    inline bool is_enabled(LogLevel lvl)
    {
        const LogLevel cur = level();
        return cur != LogLevel::Off && lvl >= cur;
    }

    inline bool open_log_file(const std::string &path)
    {
        LogSink &sink = log_sink();
        std::lock_guard<std::mutex> lock(sink.mtx);
        if (sink.file.is_open())
            sink.file.close();

        sink.file.open(path, std::ios::out | std::ios::app);
        if (!sink.file.is_open())
        {
            sink.file_path.clear();
            std::fprintf(stderr, "[ERROR] Failed to open log file: %s\n", path.c_str());
            return false;
        }
        sink.file_path = path;
        return true;
    }

    inline void close_log_file()
    {
        LogSink &sink = log_sink();
        std::lock_guard<std::mutex> lock(sink.mtx);
        if (sink.file.is_open())
            sink.file.close();
        sink.file_path.clear();
    }

    // Tags every line logged on this thread with "{source}" until destroyed.
    class ScopedLogSource
    {
    public:
        explicit ScopedLogSource(const std::string &source_id)
            : prev_(log_source())
        {
            log_source() = source_id;
        }
        ~ScopedLogSource() { log_source() = prev_; }

        ScopedLogSource(const ScopedLogSource &) = delete;
        ScopedLogSource &operator=(const ScopedLogSource &) = delete;

    private:
        std::string prev_;
    };

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        if (!is_enabled(lvl))
            return;

        struct timeval tv{};
        ::gettimeofday(&tv, nullptr);
        std::time_t t = tv.tv_sec;
        std::tm tm{};
        localtime_r(&t, &tm);

        char ts[32];
        std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                      tm.tm_hour, tm.tm_min, tm.tm_sec,
                      static_cast<int>(tv.tv_usec / 1000));

        char msg[1024];
        std::vsnprintf(msg, sizeof(msg), fmt, args);

        char line[1200];
        const std::string &src = log_source();
        if (src.empty())
            std::snprintf(line, sizeof(line), "[%s] %-5s: %s\n", ts, to_string(lvl), msg);
        else
            std::snprintf(line, sizeof(line), "[%s] %-5s: {%s} %s\n", ts, to_string(lvl), src.c_str(), msg);

        LogSink &sink = log_sink();
        std::lock_guard<std::mutex> lock(sink.mtx);
        std::fputs(line, stderr);
        if (sink.file.is_open())
        {
            sink.file << line;
            sink.file.flush();
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

#pragma once
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace utils
{

    // Timestamps travel as float seconds; windowing is done on integer
    // microseconds so that e.g. 0.3 s never lands in the 0.2 s bucket.
    inline int64_t seconds_to_us(double ts_s)
    {
        return static_cast<int64_t>(std::llround(ts_s * 1e6));
    }

    inline double us_to_seconds(int64_t us)
    {
        return static_cast<double>(us) / 1e6;
    }

    // floor(a / b) for b > 0, correct for negative a
    inline int64_t floor_div(int64_t a, int64_t b)
    {
        int64_t q = a / b;
        if ((a % b != 0) && (a < 0))
            --q;
        return q;
    }

    // Start of the fixed, epoch-aligned interval containing ts_s
    inline int64_t align_down_us(double ts_s, int64_t length_us)
    {
        return floor_div(seconds_to_us(ts_s), length_us) * length_us;
    }

    // UTC calendar date "YYYY-MM-DD"
    inline std::string utc_date(double ts_s)
    {
        std::time_t t = static_cast<std::time_t>(std::floor(ts_s));
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
        return buf;
    }

    // UTC "YYYY-MM-DDTHH:MM:SS.mmm"
    inline std::string utc_iso8601(double ts_s)
    {
        const int64_t ms_total = static_cast<int64_t>(std::llround(ts_s * 1000.0));
        const int64_t sec = floor_div(ms_total, 1000);
        const int ms = static_cast<int>(ms_total - sec * 1000);
        std::time_t t = static_cast<std::time_t>(sec);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
        return buf;
    }

} // namespace utils

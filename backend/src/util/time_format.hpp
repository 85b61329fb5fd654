#pragma once
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

// Parses "2017-10-19T15:45:44.941Z" (fraction optional, 1-9 digits) into unix ms.
inline std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
    if (s.size() < 20 || s.back() != 'Z') return std::nullopt;
    std::string tmp(s);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, consumed = 0;
    if (std::sscanf(tmp.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &sec, &consumed) != 6 || consumed != 19) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) {
        return std::nullopt;
    }

    std::int64_t millis = 0;
    std::size_t i = 19;
    if (tmp[i] == '.') {
        ++i;
        int digits = 0;
        while (i < tmp.size() && tmp[i] >= '0' && tmp[i] <= '9') {
            if (digits < 3) millis = millis * 10 + (tmp[i] - '0');
            ++digits;
            ++i;
        }
        if (digits == 0) return std::nullopt;
        for (int k = digits; k < 3; ++k) millis *= 10;
    }
    if (i != tmp.size() - 1) return std::nullopt;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon  = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min  = mi;
    tm.tm_sec  = sec;
    const std::time_t t = timegm(&tm);
    return static_cast<std::int64_t>(t) * 1000 + millis;
}

// Inverse of parse_iso8601_ms, always with millisecond precision.
inline std::string format_iso8601_ms(std::int64_t ms) {
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::int64_t frac = ms % 1000;
    if (frac < 0) { frac += 1000; --t; }
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(frac));
    return out;
}

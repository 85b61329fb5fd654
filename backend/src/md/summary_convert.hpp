#pragma once
#include <cerrno>
#include <cstdlib>
#include <string>
#include <string_view>

#include "md_types.hpp"
#include "util/time_format.hpp"

// Decimal string to double. Empty, partial or out-of-range input yields 0.0:
// a ticker with one bad field is still worth caching.
inline double parse_decimal(std::string_view sv) {
    if (sv.empty()) return 0.0;
    std::string tmp(sv);
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size() || errno == ERANGE) return 0.0;
    return v;
}

inline Summary to_summary(const RawQuote& q) {
    Summary s;
    s.id           = q.symbol;
    s.symbol       = q.symbol;
    s.last         = q.last;
    s.ask          = q.ask;
    s.bid          = q.bid;
    s.open         = q.open;
    s.low          = q.low;
    s.high         = q.high;
    s.volume       = q.volume;
    s.volume_quote = q.volume_quote;
    s.ts_ms        = q.ts_ms;
    return s;
}

inline Summary to_summary(const TickerUpdate& u) {
    Summary s;
    s.id           = u.symbol;
    s.symbol       = u.symbol;
    s.last         = parse_decimal(u.last);
    s.ask          = parse_decimal(u.ask);
    s.bid          = parse_decimal(u.bid);
    s.open         = parse_decimal(u.open);
    s.low          = parse_decimal(u.low);
    s.high         = parse_decimal(u.high);
    s.volume       = parse_decimal(u.volume);
    s.volume_quote = parse_decimal(u.volume_quote);
    if (!u.timestamp.empty()) {
        s.ts_ms = parse_iso8601_ms(u.timestamp);
    }
    return s;
}

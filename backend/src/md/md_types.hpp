/*
Market summary data types shared by the cache, the REST client and the push feed
*/

#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Cached ticker snapshot for one symbol.
struct Summary
{
    std::string id;     // same as symbol, kept for the JSON surface
    std::string symbol; // exchange id, e.g. "ETHBTC"
    double last{0}, ask{0}, bid{0}, open{0}, low{0}, high{0};
    double volume{0}, volume_quote{0};
    std::optional<std::int64_t> ts_ms; // unix ms; unset on push-derived records without one
    std::string fee_currency;
    std::string full_name;
};

// Quote as returned by the REST ticker endpoint (numbers already decoded).
struct RawQuote
{
    std::string symbol;
    double last{0}, ask{0}, bid{0}, open{0}, low{0}, high{0};
    double volume{0}, volume_quote{0};
    std::optional<std::int64_t> ts_ms;
};

// Ticker notification from the push stream; numeric fields stay as sent.
struct TickerUpdate
{
    std::string symbol;
    std::string last, ask, bid, open, low, high;
    std::string volume, volume_quote;
    std::string timestamp; // may be empty
};

struct SymbolInfo
{
    std::string id;
    std::string fee_currency;
};

struct CurrencyInfo
{
    std::string id;
    std::string full_name;
};

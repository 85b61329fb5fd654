#pragma once

#include <string>
#include <vector>

#include "md/md_types.hpp"

// Pull side of an exchange: blocking calls, throw UpstreamError on any failure.
class IVenueApi {
public:
    virtual ~IVenueApi() = default;

    virtual std::string name() const = 0;

    virtual RawQuote fetch_quote(const std::string& symbol) = 0;

    // One-time listings used to build the SymbolDirectory
    virtual std::vector<SymbolInfo> list_symbols() = 0;
    virtual std::vector<CurrencyInfo> list_currencies() = 0;
};

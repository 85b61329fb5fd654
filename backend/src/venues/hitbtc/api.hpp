#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "venues/venue_api.hpp"

// REST client for the public HitBTC API v2 (no credentials needed).
// Every call is blocking and safe to run from several threads at once.
class HitbtcApi final : public IVenueApi {
public:
    explicit HitbtcApi(std::string base_url = "https://api.hitbtc.com/api/2",
                       std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::string name() const override { return "HitBTC"; }

    RawQuote fetch_quote(const std::string& symbol) override;
    std::vector<SymbolInfo> list_symbols() override;
    std::vector<CurrencyInfo> list_currencies() override;

private:
    // GET base_url_ + "/" + path; throws UpstreamError on transport failure or HTTP error
    std::string get(const std::string& path) const;

    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

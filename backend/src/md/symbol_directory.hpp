#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "md_types.hpp"

// Read-only symbol metadata built once at startup from the exchange listings:
//  - every listed symbol and its fee currency
//  - currency display names
//  - the supported set (symbols eligible for caching and push feeds)
// Shared as shared_ptr<const SymbolDirectory>; no locking needed after construction.
class SymbolDirectory {
public:
    SymbolDirectory() = default;

    // `restrict_to` narrows the supported set to listed symbols it names; empty keeps all.
    SymbolDirectory(const std::vector<SymbolInfo>& symbols,
                    const std::vector<CurrencyInfo>& currencies,
                    const std::vector<std::string>& restrict_to = {});

    bool is_listed(const std::string& symbol) const;
    bool is_supported(const std::string& symbol) const;

    // Listing order
    const std::vector<std::string>& listed() const { return listed_; }
    const std::vector<std::string>& supported() const { return supported_; }

    // Empty string when unknown
    std::string fee_currency(const std::string& symbol) const;
    std::string full_name(const std::string& currency) const;

    // Fills fee_currency and full_name from the tables.
    void enrich(Summary& s) const;

private:
    std::vector<std::string> listed_;
    std::vector<std::string> supported_;
    std::unordered_set<std::string> supported_set_;
    std::unordered_map<std::string, std::string> fee_currency_;
    std::unordered_map<std::string, std::string> full_name_;
};

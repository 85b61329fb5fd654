#include "symbol_directory.hpp"

#include <iostream>

SymbolDirectory::SymbolDirectory(const std::vector<SymbolInfo>& symbols,
                                 const std::vector<CurrencyInfo>& currencies,
                                 const std::vector<std::string>& restrict_to)
{
    listed_.reserve(symbols.size());
    for (const auto& s : symbols) {
        if (s.id.empty()) continue;
        if (fee_currency_.emplace(s.id, s.fee_currency).second) {
            listed_.push_back(s.id);
        }
    }
    for (const auto& c : currencies) {
        if (c.id.empty()) continue;
        full_name_[c.id] = c.full_name;
    }

    std::unordered_set<std::string> wanted;
    for (const auto& sym : restrict_to) {
        if (fee_currency_.find(sym) == fee_currency_.end()) {
            std::cerr << "[setup] Requested symbol '" << sym
                      << "' is not listed by the exchange and will be ignored." << std::endl;
            continue;
        }
        wanted.insert(sym);
    }

    for (const auto& sym : listed_) {
        if (!restrict_to.empty() && wanted.count(sym) == 0) continue;
        supported_.push_back(sym);
        supported_set_.insert(sym);
    }
}

bool SymbolDirectory::is_listed(const std::string& symbol) const {
    return fee_currency_.find(symbol) != fee_currency_.end();
}

bool SymbolDirectory::is_supported(const std::string& symbol) const {
    return supported_set_.count(symbol) > 0;
}

std::string SymbolDirectory::fee_currency(const std::string& symbol) const {
    auto it = fee_currency_.find(symbol);
    return it == fee_currency_.end() ? std::string{} : it->second;
}

std::string SymbolDirectory::full_name(const std::string& currency) const {
    auto it = full_name_.find(currency);
    return it == full_name_.end() ? std::string{} : it->second;
}

void SymbolDirectory::enrich(Summary& s) const {
    s.fee_currency = fee_currency(s.symbol);
    s.full_name = full_name(s.fee_currency);
}

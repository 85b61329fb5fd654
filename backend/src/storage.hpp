#pragma once
#include "errors.hpp"
#include "md/md_types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

class ISummaryStore
{
public:
    virtual ~ISummaryStore() = default;

    // Copy of the latest record for symbol, if any
    virtual std::optional<Summary> get(const std::string &symbol) const = 0;

    // Replaces the entry, returns what was there before (last write wins)
    virtual std::optional<Summary> set(const std::string &symbol, Summary s) = 0;

    // Every stored record in unspecified order. EmptyCache when nothing is stored.
    virtual std::variant<std::vector<Summary>, SummaryError> get_all() const = 0;

    virtual std::size_t size() const = 0;
};

// Lock-striped in-memory store; `stripes` is rounded up to at least 1.
ISummaryStore *make_memory_store(std::size_t stripes = 16);

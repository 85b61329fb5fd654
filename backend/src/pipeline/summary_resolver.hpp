#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

#include "errors.hpp"
#include "storage.hpp"
#include "md/md_types.hpp"
#include "md/symbol_directory.hpp"
#include "venues/venue_api.hpp"

// Read-through lookup: cache hit returns immediately, a miss fetches the quote,
// enriches it and caches it when the symbol is supported.
//
// Two concurrent misses for the same symbol both fetch and both write; the later
// set() wins. With Options::coalesce_misses the second caller instead waits on
// the first caller's fetch.
class SummaryResolver {
public:
    using Result = std::variant<Summary, SummaryError>;

    struct Options {
        bool coalesce_misses{false};
    };

    SummaryResolver(ISummaryStore& store,
                    std::shared_ptr<const SymbolDirectory> directory,
                    IVenueApi& api)
        : SummaryResolver(store, std::move(directory), api, Options{}) {}

    SummaryResolver(ISummaryStore& store,
                    std::shared_ptr<const SymbolDirectory> directory,
                    IVenueApi& api,
                    Options opts)
        : store_(store), directory_(std::move(directory)), api_(api), opts_(opts) {}

    // Blocks for the network round trip on a miss.
    Result resolve(const std::string& symbol);

private:
    Result fetch_and_fill(const std::string& symbol);
    Result resolve_coalesced(const std::string& symbol);

    ISummaryStore& store_;
    std::shared_ptr<const SymbolDirectory> directory_;
    IVenueApi& api_;
    Options opts_;

    std::mutex inflight_m_; // protects inflight_
    std::unordered_map<std::string, std::shared_future<Result>> inflight_;
};

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "storage.hpp"
#include "md/symbol_directory.hpp"
#include "pipeline/summary_resolver.hpp"
#include "server/feed_coordinator.hpp"

// Entry point used by the HTTP layer. Wraps the resolver and the store;
// the feed coordinator is optional (absent when the push transport is down).
class SummaryService {
public:
    SummaryService(ISummaryStore& store,
                   std::shared_ptr<const SymbolDirectory> directory,
                   SummaryResolver& resolver,
                   const FeedCoordinator* feeds = nullptr)
        : store_(store), directory_(std::move(directory)), resolver_(resolver), feeds_(feeds) {}

    // Cached record, or a synchronous fetch on miss. Symbols outside the supported
    // set are fetched but never cached.
    std::variant<Summary, SummaryError> lookup(const std::string& symbol) const {
        return resolver_.resolve(symbol);
    }

    std::variant<std::vector<Summary>, SummaryError> all_cached() const {
        return store_.get_all();
    }

    bool is_listed(const std::string& symbol) const { return directory_->is_listed(symbol); }

    std::size_t cached_count() const { return store_.size(); }

    std::vector<FeedCoordinator::FeedStatus> feed_status() const {
        if (!feeds_) return {};
        return feeds_->status();
    }

    std::uint64_t decode_errors() const { return feeds_ ? feeds_->decode_errors() : 0; }

private:
    ISummaryStore& store_;
    std::shared_ptr<const SymbolDirectory> directory_;
    SummaryResolver& resolver_;
    const FeedCoordinator* feeds_;
};

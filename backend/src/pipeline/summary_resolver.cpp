#include "summary_resolver.hpp"
#include "md/summary_convert.hpp"

#include <exception>
#include <iostream>

SummaryResolver::Result SummaryResolver::resolve(const std::string& symbol) {
    if (auto cached = store_.get(symbol)) {
        return std::move(*cached);
    }
    if (opts_.coalesce_misses) {
        return resolve_coalesced(symbol);
    }
    return fetch_and_fill(symbol);
}

SummaryResolver::Result SummaryResolver::fetch_and_fill(const std::string& symbol) {
    RawQuote quote;
    try {
        quote = api_.fetch_quote(symbol);
    } catch (const std::exception& e) {
        std::cerr << "[resolver] fetch failed for '" << symbol << "': " << e.what() << "\n";
        return SummaryError{SummaryErrorCode::UpstreamUnavailable, e.what()};
    }

    Summary s = to_summary(quote);
    if (s.symbol.empty()) {
        s.symbol = symbol;
        s.id = symbol;
    }
    directory_->enrich(s);

    // Not atomic with the get() in resolve(): a push update landing in between is
    // overwritten here, and the next push overwrites us in turn.
    if (directory_->is_supported(s.symbol)) {
        store_.set(symbol, s);
    }
    return s;
}

SummaryResolver::Result SummaryResolver::resolve_coalesced(const std::string& symbol) {
    std::promise<Result> promise;
    std::shared_future<Result> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lk(inflight_m_);
        auto it = inflight_.find(symbol);
        if (it != inflight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            inflight_.emplace(symbol, pending);
            leader = true;
        }
    }

    if (!leader) {
        return pending.get();
    }

    Result r;
    try {
        r = fetch_and_fill(symbol);
    } catch (...) {
        // Waiters get the same exception; the entry must not outlive the fetch
        {
            std::lock_guard<std::mutex> lk(inflight_m_);
            inflight_.erase(symbol);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    {
        std::lock_guard<std::mutex> lk(inflight_m_);
        inflight_.erase(symbol);
    }
    promise.set_value(r);
    return r;
}

#include "feed_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

FeedCoordinator::FeedCoordinator(ISummaryStore& store,
                                 std::shared_ptr<const SymbolDirectory> directory,
                                 IMarketWs& ws,
                                 Options opts)
    : store_(store), directory_(std::move(directory)), ws_(ws), opts_(opts) {
    errors_ = ws_.errors();
    if (errors_) {
        running_.store(true, std::memory_order_relaxed);
        error_reporter_ = std::thread([this] { error_loop(); });
    }
}

std::vector<FeedCoordinator::StartFailure> FeedCoordinator::start_all() {
    std::vector<StartFailure> failures;
    for (const auto& symbol : directory_->supported()) {
        if (auto err = subscribe(symbol)) {
            failures.push_back(StartFailure{symbol, std::move(*err)});
        }
    }
    return failures;
}

std::optional<SummaryError> FeedCoordinator::subscribe(const std::string& symbol) {
    if (!directory_->is_supported(symbol)) {
        return SummaryError{SummaryErrorCode::SubscriptionFailed,
                            "symbol '" + symbol + "' is not supported"};
    }

    std::shared_ptr<SymbolFeed> feed;
    {
        std::lock_guard<std::mutex> lk(m_);
        // Checked under m_: shutdown() either sees this feed or we see the flag
        if (shut_down_.load(std::memory_order_acquire)) {
            return SummaryError{SummaryErrorCode::SubscriptionFailed, "feed coordinator is shut down"};
        }
        auto it = feeds_.find(symbol);
        if (it == feeds_.end()) {
            it = feeds_.emplace(symbol, std::make_shared<SymbolFeed>(
                     symbol, store_, directory_, ws_, opts_.idle_backoff)).first;
        }
        feed = it->second;
    }

    // Blocks on the exchange acknowledgement; must not hold m_.
    // A concurrent shutdown() closes the feed first or stops it right after.
    try {
        feed->start();
    } catch (const std::exception& e) {
        std::cerr << "[feed] Subscription for '" << symbol << "' failed: " << e.what() << std::endl;
        return SummaryError{SummaryErrorCode::SubscriptionFailed, e.what()};
    }

    std::cout << "[feed] Pair '" << symbol << "' subscribed and running." << std::endl;
    return std::nullopt;
}

void FeedCoordinator::unsubscribe(const std::string& symbol) {
    std::shared_ptr<SymbolFeed> feed;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = feeds_.find(symbol);
        if (it == feeds_.end()) return;
        feed = it->second;
    }
    feed->stop();
    std::cout << "[feed] Pair '" << symbol << "' unsubscribed." << std::endl;
}

void FeedCoordinator::shutdown() {
    std::vector<std::shared_ptr<SymbolFeed>> to_stop;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (shut_down_.exchange(true, std::memory_order_acq_rel)) return;
        to_stop.reserve(feeds_.size());
        for (auto& kv : feeds_) {
            to_stop.push_back(kv.second);
        }
    }

    for (auto& feed : to_stop) {
        feed->close();
    }

    running_.store(false, std::memory_order_relaxed);
    if (error_reporter_.joinable()) error_reporter_.join();

    std::cout << "[feed] Shutdown complete (" << to_stop.size() << " feeds stopped, "
              << decode_errors() << " decode errors)." << std::endl;
}

FeedState FeedCoordinator::state(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = feeds_.find(symbol);
    if (it == feeds_.end()) return FeedState::Unsubscribed;
    return it->second->state();
}

std::vector<FeedCoordinator::FeedStatus> FeedCoordinator::status() const {
    std::vector<FeedStatus> out;
    {
        std::lock_guard<std::mutex> lk(m_);
        out.reserve(feeds_.size());
        for (const auto& kv : feeds_) {
            out.push_back(FeedStatus{kv.first, kv.second->state(),
                                     kv.second->applied(), kv.second->skipped()});
        }
    }
    std::sort(out.begin(), out.end(),
              [](const FeedStatus& a, const FeedStatus& b) { return a.symbol < b.symbol; });
    return out;
}

// Drains the transport's decode-error side channel
void FeedCoordinator::error_loop() {
    FeedErrorEvent ev;
    while (running_.load(std::memory_order_relaxed)) {
        if (!errors_->try_pop(ev)) {
            if (errors_->drained()) break;
            std::this_thread::sleep_for(opts_.error_poll);
            continue;
        }
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[feed] Decode error"
                  << (ev.symbol.empty() ? std::string{} : " for '" + ev.symbol + "'")
                  << ": " << ev.message << std::endl;
    }
}

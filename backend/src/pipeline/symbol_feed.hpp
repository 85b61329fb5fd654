#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "storage.hpp"
#include "md/symbol_directory.hpp"
#include "venues/market_ws.hpp"

enum class FeedState {
    Unsubscribed,
    Subscribing,
    Active,
    Closing,
};

inline const char* to_cstr(FeedState s) {
    switch (s) {
        case FeedState::Unsubscribed: return "unsubscribed";
        case FeedState::Subscribing:  return "subscribing";
        case FeedState::Active:       return "active";
        case FeedState::Closing:      return "closing";
    }
    return "?";
}

// SymbolFeed supervises the push subscription of one symbol.
// Each SymbolFeed owns:
//  - the update channel handed out by the transport
//  - a listener thread that converts, enriches and writes every update to the store
// The listener only talks to the rest of the process through ISummaryStore.
class SymbolFeed {
public:
    SymbolFeed(std::string symbol,
               ISummaryStore& store,
               std::shared_ptr<const SymbolDirectory> directory,
               IMarketWs& ws,
               std::chrono::microseconds idle_backoff = std::chrono::microseconds(1000))
    : symbol_(std::move(symbol))
    , store_(store)
    , directory_(std::move(directory))
    , ws_(ws)
    , idle_backoff_(idle_backoff) {}

    ~SymbolFeed() { stop(); }

    SymbolFeed(const SymbolFeed&) = delete;
    SymbolFeed& operator=(const SymbolFeed&) = delete;

    // Unsubscribed -> Subscribing -> Active. No-op unless Unsubscribed.
    // Throws SubscriptionError and falls back to Unsubscribed when the transport refuses.
    void start();

    // Active -> Closing -> Unsubscribed. Idempotent. Once it returns no further
    // write for this symbol reaches the store from this feed.
    void stop();

    // stop() that also refuses every later start(). Used at process shutdown.
    void close();

    FeedState state() const noexcept { return state_.load(std::memory_order_acquire); }
    const std::string& symbol() const noexcept { return symbol_; }

    std::uint64_t applied() const noexcept { return applied_.load(std::memory_order_relaxed); }
    std::uint64_t skipped() const noexcept { return skipped_.load(std::memory_order_relaxed); }

private:
    void listen_loop();
    void apply(const TickerUpdate& u);

    std::string symbol_;
    ISummaryStore& store_;
    std::shared_ptr<const SymbolDirectory> directory_;
    IMarketWs& ws_;
    std::chrono::microseconds idle_backoff_;

    std::mutex lifecycle_m_; // serializes start/stop
    bool closed_{false};     // guarded by lifecycle_m_
    std::mutex gate_;        // orders the stop flag against the last store write
    std::atomic<FeedState> state_{FeedState::Unsubscribed};
    std::atomic<bool> stop_requested_{false};
    std::shared_ptr<UpdateChannel> channel_;
    std::thread listener_;

    std::atomic<std::uint64_t> applied_{0};
    std::atomic<std::uint64_t> skipped_{0};
};

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "storage.hpp"
#include "md/symbol_directory.hpp"
#include "pipeline/symbol_feed.hpp"
#include "venues/market_ws.hpp"

// Owns one SymbolFeed per supported symbol and the decode-error reporter.
class FeedCoordinator {
public:
    // FeedCoordinator config option
    struct Options {
        std::chrono::microseconds idle_backoff{std::chrono::microseconds(1000)};
        std::chrono::milliseconds error_poll{std::chrono::milliseconds(50)};
    };

    struct StartFailure {
        std::string symbol;
        SummaryError error;
    };

    struct FeedStatus {
        std::string symbol;
        FeedState state{FeedState::Unsubscribed};
        std::uint64_t applied{0};
        std::uint64_t skipped{0};
    };

    FeedCoordinator(ISummaryStore& store,
                    std::shared_ptr<const SymbolDirectory> directory,
                    IMarketWs& ws)
        : FeedCoordinator(store, std::move(directory), ws, Options{}) {}

    FeedCoordinator(ISummaryStore& store,
                    std::shared_ptr<const SymbolDirectory> directory,
                    IMarketWs& ws,
                    Options opts);

    ~FeedCoordinator() { shutdown(); }

    FeedCoordinator(const FeedCoordinator&) = delete;
    FeedCoordinator& operator=(const FeedCoordinator&) = delete;

    // Subscribes every supported symbol. One symbol failing does not stop the others.
    std::vector<StartFailure> start_all();

    // Starts (or restarts) the feed of one supported symbol.
    std::optional<SummaryError> subscribe(const std::string& symbol);

    void unsubscribe(const std::string& symbol);

    // Stops every feed and the error reporter. Safe to call more than once.
    void shutdown();

    FeedState state(const std::string& symbol) const;
    std::vector<FeedStatus> status() const;
    std::uint64_t decode_errors() const noexcept {
        return decode_errors_.load(std::memory_order_relaxed);
    }

private:
    void error_loop();

    ISummaryStore& store_;
    std::shared_ptr<const SymbolDirectory> directory_;
    IMarketWs& ws_;
    Options opts_;

    mutable std::mutex m_; // protects feeds_
    std::unordered_map<std::string, std::shared_ptr<SymbolFeed>> feeds_;

    std::atomic<bool> shut_down_{false};
    std::atomic<bool> running_{false};
    std::shared_ptr<ErrorChannel> errors_;
    std::thread error_reporter_;
    std::atomic<std::uint64_t> decode_errors_{0};
};

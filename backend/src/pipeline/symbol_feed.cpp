#include "symbol_feed.hpp"
#include "errors.hpp"
#include "md/summary_convert.hpp"

#include <exception>
#include <iostream>

void SymbolFeed::start() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    if (closed_) throw SubscriptionError("subscribe " + symbol_ + ": feed is closed");
    if (state_.load(std::memory_order_acquire) != FeedState::Unsubscribed) return;

    // Previous run ended because the transport closed the channel
    if (listener_.joinable()) listener_.join();
    channel_.reset();

    state_.store(FeedState::Subscribing, std::memory_order_release);
    stop_requested_.store(false, std::memory_order_release);

    std::shared_ptr<UpdateChannel> ch;
    try {
        ch = ws_.subscribe(symbol_);
    } catch (const std::exception& e) {
        state_.store(FeedState::Unsubscribed, std::memory_order_release);
        throw SubscriptionError("subscribe " + symbol_ + ": " + e.what());
    }
    if (!ch) {
        state_.store(FeedState::Unsubscribed, std::memory_order_release);
        throw SubscriptionError("subscribe " + symbol_ + ": transport returned no channel");
    }

    channel_ = std::move(ch);
    state_.store(FeedState::Active, std::memory_order_release);
    listener_ = std::thread([this] { listen_loop(); });
}

void SymbolFeed::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    const FeedState prev = state_.exchange(FeedState::Closing, std::memory_order_acq_rel);
    if (prev == FeedState::Unsubscribed && !listener_.joinable()) {
        state_.store(FeedState::Unsubscribed, std::memory_order_release);
        return;
    }

    {
        std::lock_guard<std::mutex> g(gate_);
        stop_requested_.store(true, std::memory_order_release);
    }

    // prev == Unsubscribed here means the transport already closed the channel
    if (prev == FeedState::Active && channel_ && !channel_->closed()) {
        try {
            ws_.unsubscribe(symbol_);
        } catch (const std::exception& e) {
            std::cerr << "[feed] unsubscribe '" << symbol_ << "' failed: " << e.what() << std::endl;
        }
        channel_->close(); // no-op when the transport already closed it
    }

    if (listener_.joinable()) listener_.join();
    channel_.reset();
    state_.store(FeedState::Unsubscribed, std::memory_order_release);
}

void SymbolFeed::close() {
    {
        std::lock_guard<std::mutex> lk(lifecycle_m_);
        closed_ = true;
    }
    stop();
}

void SymbolFeed::listen_loop() {
    TickerUpdate u;
    while (!stop_requested_.load(std::memory_order_acquire)) {
        if (!channel_->try_pop(u)) {
            if (channel_->drained()) {
                FeedState expected = FeedState::Active;
                if (state_.compare_exchange_strong(expected, FeedState::Unsubscribed,
                                                   std::memory_order_acq_rel)) {
                    std::cout << "[feed] Channel for '" << symbol_
                              << "' closed by transport; listener exiting." << std::endl;
                }
                return;
            }
            std::this_thread::sleep_for(idle_backoff_);
            continue;
        }
        apply(u);
    }
}

void SymbolFeed::apply(const TickerUpdate& u) {
    Summary s = to_summary(u);
    if (s.symbol.empty()) {
        s.symbol = symbol_;
        s.id = symbol_;
    }
    directory_->enrich(s);

    if (!directory_->is_supported(s.symbol)) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::lock_guard<std::mutex> g(gate_);
    if (stop_requested_.load(std::memory_order_acquire)) return;
    store_.set(symbol_, std::move(s));
    applied_.fetch_add(1, std::memory_order_relaxed);
}

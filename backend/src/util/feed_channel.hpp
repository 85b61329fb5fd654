#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

// Closable single-producer / single-consumer channel.
// - CapacityPow2 must be a power-of-two; one slot stays unused.
// - exactly one producer thread calls try_push, exactly one consumer calls try_pop.
// - close() may be called from any thread; only the first call returns true.
// Pushes after close are refused. Items already queued stay poppable.
template <typename T, std::size_t CapacityPow2 = 1024>
class FeedChannel {
    static_assert(CapacityPow2 >= 2 && (CapacityPow2 & (CapacityPow2 - 1)) == 0,
                  "Capacity must be power of two");

public:
    FeedChannel() : buf_(CapacityPow2) {}

    FeedChannel(const FeedChannel&) = delete;
    FeedChannel& operator=(const FeedChannel&) = delete;

    // Producer: false if closed or full. A full channel drops the new item and counts it.
    bool try_push(T&& v) {
        if (closed_.load(std::memory_order_acquire)) return false;
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & mask_;
        if (next == tail_.load(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        buf_[head] = std::move(v);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer: false if nothing is queued
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) return false;
        out = std::move(buf_[tail]);
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool close() noexcept {
        return !closed_.exchange(true, std::memory_order_acq_rel);
    }

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    // Closed and nothing left to pop
    bool drained() const { return closed() && empty(); }

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::size_t capacity() const { return CapacityPow2 - 1; }

private:
    static constexpr std::size_t mask_ = CapacityPow2 - 1;
    std::vector<T> buf_;
    std::atomic<std::size_t> head_{0}; // producer writes
    std::atomic<std::size_t> tail_{0}; // consumer writes
    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> dropped_{0};
};

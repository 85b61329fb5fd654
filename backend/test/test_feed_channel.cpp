#include "util/feed_channel.hpp"
#include "venues/market_ws.hpp"
#include "_assert.hpp"

#include <iostream>
#include <thread>

static void test_fifo_and_close() {
    FeedChannel<int, 8> ch;
    ASSERT_EQ(ch.capacity(), 7u);
    ASSERT_TRUE(ch.empty());

    for (int i = 0; i < 3; ++i) ASSERT_TRUE(ch.try_push(int(i)));
    ASSERT_TRUE(ch.close());
    ASSERT_FALSE(ch.close());
    ASSERT_FALSE(ch.try_push(99));

    // Items queued before close stay poppable
    int v = -1;
    ASSERT_FALSE(ch.drained());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(ch.try_pop(v));
        ASSERT_EQ(v, i);
    }
    ASSERT_FALSE(ch.try_pop(v));
    ASSERT_TRUE(ch.drained());
}

static void test_overflow_drops_newest() {
    FeedChannel<int, 4> ch;
    ASSERT_TRUE(ch.try_push(1));
    ASSERT_TRUE(ch.try_push(2));
    ASSERT_TRUE(ch.try_push(3));
    ASSERT_FALSE(ch.try_push(4));
    ASSERT_EQ(ch.dropped(), 1u);

    int v = 0;
    ASSERT_TRUE(ch.try_pop(v));
    ASSERT_EQ(v, 1);
    ASSERT_TRUE(ch.try_push(5));

    ASSERT_TRUE(ch.try_pop(v)); ASSERT_EQ(v, 2);
    ASSERT_TRUE(ch.try_pop(v)); ASSERT_EQ(v, 3);
    ASSERT_TRUE(ch.try_pop(v)); ASSERT_EQ(v, 5);
}

static void test_producer_consumer_order() {
    FeedChannel<int, 64> ch;
    constexpr int kItems = 100000;
    std::thread producer([&] {
        for (int i = 0; i < kItems; ++i) {
            while (!ch.try_push(int(i))) std::this_thread::yield();
        }
        ch.close();
    });

    int expected = 0;
    int v = 0;
    while (!ch.drained()) {
        if (ch.try_pop(v)) {
            ASSERT_EQ(v, expected);
            ++expected;
        }
    }
    while (ch.try_pop(v)) { ASSERT_EQ(v, expected); ++expected; }
    producer.join();
    ASSERT_EQ(expected, kItems);
}

// One update channel per subscribed symbol stays small
static void test_update_channel_size() {
    UpdateChannel ch;
    ASSERT_EQ(ch.capacity(), 63u);
    for (int i = 0; i < 63; ++i) ASSERT_TRUE(ch.try_push(TickerUpdate{}));
    ASSERT_FALSE(ch.try_push(TickerUpdate{}));
    ASSERT_EQ(ch.dropped(), 1u);
}

int main() {
    test_fifo_and_close();
    test_overflow_drops_newest();
    test_producer_consumer_order();
    test_update_channel_size();
    std::cout << "[test_feed_channel] OK\n";
    return 0;
}

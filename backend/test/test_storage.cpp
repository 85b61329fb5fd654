#include "storage.hpp"
#include "_assert.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

static Summary record(const std::string& sym, double last) {
    Summary s;
    s.id = sym;
    s.symbol = sym;
    s.last = last;
    return s;
}

static void test_empty_store() {
    std::unique_ptr<ISummaryStore> store(make_memory_store());
    ASSERT_FALSE(store->get("ETHBTC").has_value());
    ASSERT_EQ(store->size(), 0u);

    auto all = store->get_all();
    auto* err = std::get_if<SummaryError>(&all);
    ASSERT_TRUE(err != nullptr);
    ASSERT_TRUE(err->code == SummaryErrorCode::EmptyCache);
    ASSERT_STR_EQ(err->message, "no data present");
}

static void test_last_write_wins() {
    std::unique_ptr<ISummaryStore> store(make_memory_store());
    ASSERT_FALSE(store->set("ETHBTC", record("ETHBTC", 1.0)).has_value());

    auto prev = store->set("ETHBTC", record("ETHBTC", 2.0));
    ASSERT_TRUE(prev.has_value());
    ASSERT_NEAR(prev->last, 1.0, 1e-12);

    auto got = store->get("ETHBTC");
    ASSERT_TRUE(got.has_value());
    ASSERT_NEAR(got->last, 2.0, 1e-12);
    ASSERT_EQ(store->size(), 1u);
}

static void test_get_all_returns_every_symbol() {
    std::unique_ptr<ISummaryStore> store(make_memory_store(4));
    store->set("ETHBTC", record("ETHBTC", 0.05));
    store->set("XRPBTC", record("XRPBTC", 0.00002));
    store->set("LTCUSD", record("LTCUSD", 60));

    auto all = store->get_all();
    auto* rows = std::get_if<std::vector<Summary>>(&all);
    ASSERT_TRUE(rows != nullptr);
    ASSERT_EQ(rows->size(), 3u);
}

static void test_single_stripe() {
    std::unique_ptr<ISummaryStore> store(make_memory_store(0));
    store->set("A", record("A", 1));
    store->set("B", record("B", 2));
    ASSERT_EQ(store->size(), 2u);
    ASSERT_NEAR(store->get("B")->last, 2.0, 1e-12);
}

// Readers never observe a record that was not written whole
static void test_concurrent_readers_and_writers() {
    std::unique_ptr<ISummaryStore> store(make_memory_store());
    constexpr int kWriters = 4;
    constexpr int kWrites = 2000;

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < kWrites; ++i) {
                Summary s = record("ETHBTC", static_cast<double>(i));
                s.bid = static_cast<double>(i);
                s.ask = static_cast<double>(i);
                s.fee_currency = "W" + std::to_string(w);
                store->set("ETHBTC", std::move(s));
                store->set("SYM" + std::to_string(i % 50), record("SYM", i));
            }
        });
    }
    for (int r = 0; r < 2; ++r) {
        threads.emplace_back([&] {
            for (int i = 0; i < kWrites; ++i) {
                if (auto s = store->get("ETHBTC")) {
                    ASSERT_NEAR(s->last, s->bid, 0.0);
                    ASSERT_NEAR(s->last, s->ask, 0.0);
                }
                (void)store->get_all();
            }
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_EQ(store->size(), 51u);
    auto last = store->get("ETHBTC");
    ASSERT_TRUE(last.has_value());
    ASSERT_NEAR(last->last, static_cast<double>(kWrites - 1), 0.0);
}

int main() {
    test_empty_store();
    test_last_write_wins();
    test_get_all_returns_every_symbol();
    test_single_stripe();
    test_concurrent_readers_and_writers();
    std::cout << "[test_storage] OK\n";
    return 0;
}

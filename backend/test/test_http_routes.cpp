#include "server/http_routes.hpp"
#include "fakes.hpp"
#include "_assert.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

using json = nlohmann::json;

struct Harness {
    std::unique_ptr<ISummaryStore> store{make_memory_store()};
    std::shared_ptr<const SymbolDirectory> directory = make_directory({"ETHBTC"});
    FakeVenueApi api;
    SummaryResolver resolver{*store, directory, api};
    SummaryService service{*store, directory, resolver};

    http::response<http::string_body> call(http::verb method, const std::string& target) {
        http::request<http::string_body> req{method, target, 11};
        http::response<http::string_body> res;
        handle_request(service, req, res);
        return res;
    }
};

static void test_all_on_empty_cache() {
    Harness h;
    auto res = h.call(http::verb::get, "/currency/all");
    ASSERT_EQ(res.result_int(), 404u);
    ASSERT_STR_EQ(json::parse(res.body())["error"].get<std::string>(), "no data present");
}

static void test_symbol_lookup() {
    Harness h;
    h.api.set_quote(make_quote("ETHBTC", 0.05));

    auto res = h.call(http::verb::get, "/currency/ETHBTC");
    ASSERT_EQ(res.result_int(), 200u);
    ASSERT_STR_EQ(std::string(res[http::field::content_type]), "application/json");
    json body = json::parse(res.body());
    ASSERT_STR_EQ(body["id"].get<std::string>(), "ETHBTC");
    ASSERT_STR_EQ(body["symbol"].get<std::string>(), "ETHBTC");
    ASSERT_STR_EQ(body["feecurrency"].get<std::string>(), "BTC");
    ASSERT_STR_EQ(body["fullname"].get<std::string>(), "Bitcoin");
    ASSERT_NEAR(body["last"].get<double>(), 0.05, 1e-12);
    ASSERT_TRUE(body.contains("volumeQuote"));
    ASSERT_STR_EQ(body["timestamp"].get<std::string>(), "2017-10-19T15:45:44.941Z");

    // Lower-case path resolves to the same symbol and hits the cache
    auto again = h.call(http::verb::get, "/currency/ethbtc");
    ASSERT_EQ(again.result_int(), 200u);
    ASSERT_EQ(h.api.fetches(), 1);

    auto all = h.call(http::verb::get, "/currency/all");
    ASSERT_EQ(all.result_int(), 200u);
    json rows = json::parse(all.body())["currencies"];
    ASSERT_EQ(rows.size(), 1u);
    ASSERT_STR_EQ(rows[0]["symbol"].get<std::string>(), "ETHBTC");
}

static void test_listed_but_unsupported_symbol() {
    Harness h;
    auto res = h.call(http::verb::get, "/currency/LTCUSD");
    ASSERT_EQ(res.result_int(), 200u);
    ASSERT_EQ(h.store->size(), 0u);
}

static void test_unknown_symbol() {
    Harness h;
    auto res = h.call(http::verb::get, "/currency/DOGEBTC");
    ASSERT_EQ(res.result_int(), 404u);
    ASSERT_STR_EQ(json::parse(res.body())["error"].get<std::string>(), "Not a valid Symbol");
    ASSERT_EQ(h.api.fetches(), 0);
}

static void test_upstream_failure_maps_to_502() {
    Harness h;
    h.api.set_failing(true);
    auto res = h.call(http::verb::get, "/currency/ETHBTC");
    ASSERT_EQ(res.result_int(), 502u);
    ASSERT_STR_EQ(json::parse(res.body())["error"].get<std::string>(), "exchange unreachable");
}

static void test_null_timestamp() {
    Harness h;
    RawQuote q = make_quote("ETHBTC", 1);
    q.ts_ms.reset();
    h.api.set_quote(q);
    auto res = h.call(http::verb::get, "/currency/ETHBTC");
    ASSERT_TRUE(json::parse(res.body())["timestamp"].is_null());
}

static void test_other_routes() {
    Harness h;
    auto health = h.call(http::verb::get, "/api/health");
    ASSERT_EQ(health.result_int(), 200u);
    json body = json::parse(health.body());
    ASSERT_STR_EQ(body["status"].get<std::string>(), "ok");
    ASSERT_TRUE(body["feeds"].is_array());

    ASSERT_EQ(h.call(http::verb::get, "/nope").result_int(), 404u);
    ASSERT_EQ(h.call(http::verb::post, "/currency/all").result_int(), 405u);
    ASSERT_EQ(h.call(http::verb::delete_, "/currency/ETHBTC").result_int(), 405u);
    ASSERT_EQ(h.call(http::verb::options, "/currency/all").result_int(), 204u);
    ASSERT_STR_EQ(std::string(health[http::field::server]), "market-summary/0.1");
}

int main() {
    test_all_on_empty_cache();
    test_symbol_lookup();
    test_listed_but_unsupported_symbol();
    test_unknown_symbol();
    test_upstream_failure_maps_to_502();
    test_null_timestamp();
    test_other_routes();
    std::cout << "[test_http_routes] OK\n";
    return 0;
}

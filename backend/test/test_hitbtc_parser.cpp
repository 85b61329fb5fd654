#include "venues/hitbtc/parser.hpp"
#include "util/time_format.hpp"
#include "md/summary_convert.hpp"
#include "_assert.hpp"

#include <iostream>

static void test_ticker_body() {
    HitbtcParser p;
    const std::string body = R"({
        "ask": "0.050043", "bid": "0.050042", "last": "0.050042",
        "open": "0.047800", "low": "0.047052", "high": "0.051679",
        "volume": "36456.720", "volumeQuote": "1782.625000",
        "timestamp": "2017-10-19T15:45:44.941Z", "symbol": "ETHBTC"
    })";
    RawQuote q = p.parse_ticker(body);
    ASSERT_STR_EQ(q.symbol, "ETHBTC");
    ASSERT_NEAR(q.ask, 0.050043, 1e-12);
    ASSERT_NEAR(q.last, 0.050042, 1e-12);
    ASSERT_NEAR(q.volume_quote, 1782.625, 1e-9);
    ASSERT_TRUE(q.ts_ms.has_value());
    ASSERT_EQ(*q.ts_ms, 1508427944941LL);

    // Null prices (no trades yet) decode to zero
    RawQuote quiet = p.parse_ticker(R"({"symbol":"XRPBTC","last":null,"ask":"1e-5","timestamp":null})");
    ASSERT_NEAR(quiet.last, 0.0, 0.0);
    ASSERT_NEAR(quiet.ask, 0.00001, 1e-15);
    ASSERT_FALSE(quiet.ts_ms.has_value());
}

static void test_error_bodies() {
    HitbtcParser p;
    const std::string err = R"({"error":{"code":2001,"message":"Symbol not found","description":"Try get /api/2/public/symbol"}})";
    ASSERT_THROWS(p.parse_ticker(err), UpstreamError);
    ASSERT_THROWS(p.parse_symbols(err), UpstreamError);

    auto msg = p.exchange_error(err);
    ASSERT_TRUE(msg.has_value());
    ASSERT_STR_EQ(*msg, "Symbol not found - Try get /api/2/public/symbol");

    ASSERT_FALSE(p.exchange_error(R"({"symbol":"ETHBTC"})").has_value());
    ASSERT_FALSE(p.exchange_error("<html>bad gateway</html>").has_value());
}

static void test_malformed_input() {
    HitbtcParser p;
    ASSERT_THROWS(p.parse_ticker("{not json"), DecodeFailure);
    ASSERT_THROWS(p.parse_ticker(R"(["ETHBTC"])"), DecodeFailure);
    ASSERT_THROWS(p.parse_ticker(R"({"last":"1"})"), DecodeFailure);
    ASSERT_THROWS(p.parse_currencies(R"({"id":"BTC"})"), DecodeFailure);
    ASSERT_THROWS(p.parse_frame("]]"), DecodeFailure);
}

static void test_listings() {
    HitbtcParser p;
    auto symbols = p.parse_symbols(R"([
        {"id":"ETHBTC","baseCurrency":"ETH","quoteCurrency":"BTC","feeCurrency":"BTC"},
        {"id":"LTCUSD","baseCurrency":"LTC","quoteCurrency":"USD","feeCurrency":"USD"},
        {"baseCurrency":"nameless"}
    ])");
    ASSERT_EQ(symbols.size(), 2u);
    ASSERT_STR_EQ(symbols[0].id, "ETHBTC");
    ASSERT_STR_EQ(symbols[0].fee_currency, "BTC");
    ASSERT_STR_EQ(symbols[1].id, "LTCUSD");

    auto currencies = p.parse_currencies(R"([
        {"id":"BTC","fullName":"Bitcoin","crypto":true},
        {"id":"USD","fullName":"US Dollar","crypto":false}
    ])");
    ASSERT_EQ(currencies.size(), 2u);
    ASSERT_STR_EQ(currencies[1].full_name, "US Dollar");

    ASSERT_EQ(p.parse_symbols("[]").size(), 0u);
}

static void test_frames() {
    HitbtcParser p;

    HitbtcFrame ack = p.parse_frame(R"({"jsonrpc":"2.0","result":true,"id":7})");
    ASSERT_TRUE(ack.kind == HitbtcFrame::Kind::Response);
    ASSERT_EQ(ack.id, 7);
    ASSERT_TRUE(ack.ok);

    HitbtcFrame nack = p.parse_frame(R"({"jsonrpc":"2.0","result":false,"id":8})");
    ASSERT_TRUE(nack.kind == HitbtcFrame::Kind::Response);
    ASSERT_FALSE(nack.ok);

    HitbtcFrame rejected = p.parse_frame(
        R"({"jsonrpc":"2.0","error":{"code":2001,"message":"Symbol not found"},"id":9})");
    ASSERT_TRUE(rejected.kind == HitbtcFrame::Kind::Response);
    ASSERT_FALSE(rejected.ok);
    ASSERT_STR_EQ(rejected.error, "Symbol not found");

    HitbtcFrame tick = p.parse_frame(R"({"jsonrpc":"2.0","method":"ticker","params":{
        "ask":"0.054464","bid":"0.054463","last":"0.054463","open":"0.057133",
        "low":"0.053615","high":"0.057559","volume":"33068.346","volumeQuote":"1832.687530",
        "timestamp":"2017-10-19T15:45:44.941Z","symbol":"ETHBTC"}})");
    ASSERT_TRUE(tick.kind == HitbtcFrame::Kind::Ticker);
    ASSERT_STR_EQ(tick.ticker.symbol, "ETHBTC");
    ASSERT_STR_EQ(tick.ticker.last, "0.054463");
    ASSERT_STR_EQ(tick.ticker.volume_quote, "1832.687530");
    ASSERT_STR_EQ(tick.ticker.timestamp, "2017-10-19T15:45:44.941Z");

    HitbtcFrame other = p.parse_frame(R"({"jsonrpc":"2.0","method":"snapshotOrderbook","params":{}})");
    ASSERT_TRUE(other.kind == HitbtcFrame::Kind::Other);

    ASSERT_THROWS(p.parse_frame(R"({"method":"ticker","params":{"last":"1"}})"), DecodeFailure);
}

static void test_decimals_and_timestamps() {
    ASSERT_NEAR(parse_decimal("100.5"), 100.5, 0.0);
    ASSERT_NEAR(parse_decimal(""), 0.0, 0.0);
    ASSERT_NEAR(parse_decimal("12abc"), 0.0, 0.0);
    ASSERT_NEAR(parse_decimal("1e999"), 0.0, 0.0);

    ASSERT_EQ(*parse_iso8601_ms("2017-10-19T15:45:44Z"), 1508427944000LL);
    ASSERT_EQ(*parse_iso8601_ms("2017-10-19T15:45:44.9Z"), 1508427944900LL);
    ASSERT_EQ(*parse_iso8601_ms("2017-10-19T15:45:44.941123Z"), 1508427944941LL);
    ASSERT_FALSE(parse_iso8601_ms("2017-10-19 15:45:44Z").has_value());
    ASSERT_FALSE(parse_iso8601_ms("2017-10-19T15:45:44.Z").has_value());
    ASSERT_FALSE(parse_iso8601_ms("yesterday").has_value());

    ASSERT_STR_EQ(format_iso8601_ms(1508427944941LL), "2017-10-19T15:45:44.941Z");
    ASSERT_STR_EQ(format_iso8601_ms(0), "1970-01-01T00:00:00.000Z");
}

int main() {
    test_ticker_body();
    test_error_bodies();
    test_malformed_input();
    test_listings();
    test_frames();
    test_decimals_and_timestamps();
    std::cout << "[test_hitbtc_parser] OK\n";
    return 0;
}

#pragma once
#include "errors.hpp"
#include "md/md_types.hpp"
#include "md/summary_convert.hpp"
#include "util/time_format.hpp"

#include <simdjson.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One decoded JSON-RPC frame from the HitBTC socket.
struct HitbtcFrame {
    enum class Kind { Response, Ticker, Other };

    Kind kind{Kind::Other};

    // Response
    std::int64_t id{-1};
    bool ok{false};
    std::string error; // exchange error message when !ok

    // Ticker
    TickerUpdate ticker;
};

// HitBTC API v2 documents (REST bodies and WS frames) via simdjson ondemand.
// Malformed input throws DecodeFailure; an exchange error object throws UpstreamError.
// Not thread-safe: keep one parser per thread.
class HitbtcParser {
public:
    HitbtcParser() = default;

    // GET /public/ticker/{symbol}
    RawQuote parse_ticker(const std::string& raw) {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (auto err = parser_.iterate(pj).get(doc)) {
            throw DecodeFailure(std::string("ticker: ") + simdjson::error_message(err));
        }
        simdjson::ondemand::object obj;
        if (auto err = doc.get_object().get(obj)) {
            throw DecodeFailure(std::string("ticker: ") + simdjson::error_message(err));
        }
        throw_if_error(obj);

        RawQuote q;
        q.symbol = str_field(obj, "symbol");
        if (q.symbol.empty()) throw DecodeFailure("ticker: missing symbol");
        q.ask          = parse_decimal(str_field(obj, "ask"));
        q.bid          = parse_decimal(str_field(obj, "bid"));
        q.last         = parse_decimal(str_field(obj, "last"));
        q.open         = parse_decimal(str_field(obj, "open"));
        q.low          = parse_decimal(str_field(obj, "low"));
        q.high         = parse_decimal(str_field(obj, "high"));
        q.volume       = parse_decimal(str_field(obj, "volume"));
        q.volume_quote = parse_decimal(str_field(obj, "volumeQuote"));
        const std::string ts = str_field(obj, "timestamp");
        if (!ts.empty()) q.ts_ms = parse_iso8601_ms(ts);
        return q;
    }

    // GET /public/symbol
    std::vector<SymbolInfo> parse_symbols(const std::string& raw) {
        std::vector<SymbolInfo> out;
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        simdjson::ondemand::array arr = listing_array(pj, doc, "symbols");
        for (auto elem : arr) {
            simdjson::ondemand::object o;
            if (elem.get_object().get(o)) continue;
            SymbolInfo s;
            s.id = str_field(o, "id");
            s.fee_currency = str_field(o, "feeCurrency");
            if (!s.id.empty()) out.push_back(std::move(s));
        }
        return out;
    }

    // GET /public/currency
    std::vector<CurrencyInfo> parse_currencies(const std::string& raw) {
        std::vector<CurrencyInfo> out;
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        simdjson::ondemand::array arr = listing_array(pj, doc, "currencies");
        for (auto elem : arr) {
            simdjson::ondemand::object o;
            if (elem.get_object().get(o)) continue;
            CurrencyInfo c;
            c.id = str_field(o, "id");
            c.full_name = str_field(o, "fullName");
            if (!c.id.empty()) out.push_back(std::move(c));
        }
        return out;
    }

    // Message of an {"error": {...}} body; nullopt for anything else, including garbage.
    std::optional<std::string> exchange_error(const std::string& raw) {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) return std::nullopt;
        simdjson::ondemand::object obj;
        if (doc.get_object().get(obj)) return std::nullopt;
        simdjson::ondemand::value errv;
        if (!non_null_field(obj, "error", errv)) return std::nullopt;
        return error_message(errv);
    }

    // Socket frame: a response to one of our requests, a ticker notification, or other.
    HitbtcFrame parse_frame(const std::string& raw) {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (auto err = parser_.iterate(pj).get(doc)) {
            throw DecodeFailure(std::string("frame: ") + simdjson::error_message(err));
        }
        simdjson::ondemand::object obj;
        if (auto err = doc.get_object().get(obj)) {
            throw DecodeFailure(std::string("frame: ") + simdjson::error_message(err));
        }

        HitbtcFrame f;
        std::string_view method_sv;
        if (!obj["method"].get_string().get(method_sv)) {
            if (method_sv != "ticker") return f; // other notifications are not ours
            f.kind = HitbtcFrame::Kind::Ticker;

            simdjson::ondemand::object params;
            if (obj["params"].get_object().get(params)) {
                throw DecodeFailure("ticker notification without params object");
            }
            TickerUpdate& t = f.ticker;
            t.symbol       = str_field(params, "symbol");
            if (t.symbol.empty()) throw DecodeFailure("ticker notification without symbol");
            t.ask          = str_field(params, "ask");
            t.bid          = str_field(params, "bid");
            t.last         = str_field(params, "last");
            t.open         = str_field(params, "open");
            t.low          = str_field(params, "low");
            t.high         = str_field(params, "high");
            t.volume       = str_field(params, "volume");
            t.volume_quote = str_field(params, "volumeQuote");
            t.timestamp    = str_field(params, "timestamp");
            return f;
        }

        std::int64_t id = -1;
        if (obj["id"].get_int64().get(id)) return f; // no id: nothing to correlate
        f.kind = HitbtcFrame::Kind::Response;
        f.id = id;

        simdjson::ondemand::value errv;
        if (non_null_field(obj, "error", errv)) {
            f.ok = false;
            f.error = error_message(errv);
            return f;
        }

        simdjson::ondemand::value resv;
        if (!non_null_field(obj, "result", resv)) {
            f.error = "response without result";
            return f;
        }
        simdjson::ondemand::json_type rt;
        if (resv.type().get(rt) || rt != simdjson::ondemand::json_type::boolean) {
            f.ok = true; // non-boolean result payload
            return f;
        }
        bool result = false;
        if (resv.get_bool().get(result) || !result) {
            f.error = "request not successful";
            return f;
        }
        f.ok = true;
        return f;
    }

private:
    // Copy of a string member, empty when missing, null or not a string
    static std::string str_field(simdjson::ondemand::object& obj, const char* key) {
        std::string_view sv;
        if (obj[key].get_string().get(sv)) return {};
        return std::string(sv);
    }

    // True when `key` exists and is not null
    static bool non_null_field(simdjson::ondemand::object& obj, const char* key,
                               simdjson::ondemand::value& out) {
        if (obj[key].get(out)) return false;
        simdjson::ondemand::json_type t;
        if (out.type().get(t)) return false;
        return t != simdjson::ondemand::json_type::null;
    }

    static std::string error_message(simdjson::ondemand::value& v) {
        simdjson::ondemand::json_type t;
        if (v.type().get(t)) return "unknown exchange error";
        if (t == simdjson::ondemand::json_type::string) {
            std::string_view sv;
            if (v.get_string().get(sv)) return "unknown exchange error";
            return std::string(sv);
        }

        simdjson::ondemand::object eo;
        if (v.get_object().get(eo)) return "unknown exchange error";
        std::string msg = str_field(eo, "message");
        std::string desc = str_field(eo, "description");
        if (msg.empty()) msg = "unknown exchange error";
        if (!desc.empty()) msg += " - " + desc;
        return msg;
    }

    // Throws UpstreamError when the body is {"error": {...}}
    static void throw_if_error(simdjson::ondemand::object& obj) {
        simdjson::ondemand::value errv;
        if (non_null_field(obj, "error", errv)) {
            throw UpstreamError(error_message(errv));
        }
    }

    simdjson::ondemand::array listing_array(simdjson::padded_string& pj,
                                            simdjson::ondemand::document& doc,
                                            const char* what) {
        if (auto err = parser_.iterate(pj).get(doc)) {
            throw DecodeFailure(std::string(what) + ": " + simdjson::error_message(err));
        }
        simdjson::ondemand::json_type type;
        if (auto err = doc.type().get(type)) {
            throw DecodeFailure(std::string(what) + ": " + simdjson::error_message(err));
        }
        if (type == simdjson::ondemand::json_type::object) {
            simdjson::ondemand::object obj;
            if (!doc.get_object().get(obj)) throw_if_error(obj);
            throw DecodeFailure(std::string(what) + ": expected an array");
        }
        simdjson::ondemand::array arr;
        if (auto err = doc.get_array().get(arr)) {
            throw DecodeFailure(std::string(what) + ": " + simdjson::error_message(err));
        }
        return arr;
    }

    simdjson::ondemand::parser parser_;
};

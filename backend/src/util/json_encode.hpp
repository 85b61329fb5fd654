#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "md/md_types.hpp"
#include "util/time_format.hpp"

// Record as served over HTTP. Numbers are emitted as JSON numbers;
// a record without a timestamp carries "timestamp": null.
inline nlohmann::json summary_to_json(const Summary& s) {
    nlohmann::json j = {
        {"id",          s.id},
        {"symbol",      s.symbol},
        {"fullname",    s.full_name},
        {"feecurrency", s.fee_currency},
        {"ask",         s.ask},
        {"bid",         s.bid},
        {"last",        s.last},
        {"open",        s.open},
        {"low",         s.low},
        {"high",        s.high},
        {"volume",      s.volume},
        {"volumeQuote", s.volume_quote},
    };
    if (s.ts_ms) {
        j["timestamp"] = format_iso8601_ms(*s.ts_ms);
    } else {
        j["timestamp"] = nullptr;
    }
    return j;
}

inline nlohmann::json summaries_to_json(const std::vector<Summary>& rows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : rows) arr.push_back(summary_to_json(s));
    return arr;
}

inline std::string error_body(const std::string& message) {
    return nlohmann::json{{"error", message}}.dump();
}

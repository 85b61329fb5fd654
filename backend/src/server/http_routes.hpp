#pragma once
#include <boost/url.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <variant>
#include "util/json_encode.hpp"
#include "server/summary_service.hpp"

namespace http  = boost::beast::http;
namespace urls  = boost::urls;

namespace detail {

inline void json_reply(http::response<http::string_body>& res, http::status status, std::string body) {
    res.result(status);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
}

inline http::status status_for(SummaryErrorCode code) {
    switch (code) {
        case SummaryErrorCode::EmptyCache:          return http::status::not_found;
        case SummaryErrorCode::UpstreamUnavailable: return http::status::bad_gateway;
        case SummaryErrorCode::SubscriptionFailed:  return http::status::service_unavailable;
        case SummaryErrorCode::DecodeError:         return http::status::bad_gateway;
    }
    return http::status::internal_server_error;
}

inline std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace detail

inline void handle_request(const SummaryService& svc,
                           const http::request<http::string_body>& req,
                           http::response<http::string_body>& res)
{
    res.set(http::field::server, "market-summary/0.1");

    // CORS preflight
    if (req.method() == http::verb::options) {
        res.result(http::status::no_content);
        return;
    }

    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        detail::json_reply(res, http::status::bad_request, error_body("bad request"));
        return;
    }
    urls::url_view url = *parsed_result;
    const std::string path = url.path();

    const bool known = path == "/api/health" || path.rfind("/currency/", 0) == 0;
    if (known && req.method() != http::verb::get) {
        res.set(http::field::allow, "GET, OPTIONS");
        detail::json_reply(res, http::status::method_not_allowed, error_body("method not allowed"));
        return;
    }

    // /api/health
    if (path == "/api/health") {
        nlohmann::json feeds = nlohmann::json::array();
        for (const auto& f : svc.feed_status()) {
            feeds.push_back({
                {"symbol", f.symbol},
                {"state", to_cstr(f.state)},
                {"applied", f.applied},
                {"skipped", f.skipped},
            });
        }
        nlohmann::json body = {
            {"status", "ok"},
            {"cached", svc.cached_count()},
            {"decode_errors", svc.decode_errors()},
            {"feeds", std::move(feeds)},
        };
        detail::json_reply(res, http::status::ok, body.dump());
        return;
    }

    // /currency/all
    if (path == "/currency/all") {
        auto all = svc.all_cached();
        if (auto* err = std::get_if<SummaryError>(&all)) {
            detail::json_reply(res, detail::status_for(err->code), error_body(err->message));
            return;
        }
        auto& rows = std::get<std::vector<Summary>>(all);
        std::sort(rows.begin(), rows.end(),
                  [](const Summary& a, const Summary& b) { return a.symbol < b.symbol; });
        nlohmann::json body = {{"currencies", summaries_to_json(rows)}};
        detail::json_reply(res, http::status::ok, body.dump());
        return;
    }

    // /currency/{symbol}
    if (path.rfind("/currency/", 0) == 0) {
        const std::string symbol = detail::upper(std::string_view(path).substr(10));
        if (symbol.empty() || symbol.find('/') != std::string::npos || !svc.is_listed(symbol)) {
            detail::json_reply(res, http::status::not_found, error_body("Not a valid Symbol"));
            return;
        }
        auto found = svc.lookup(symbol);
        if (auto* err = std::get_if<SummaryError>(&found)) {
            detail::json_reply(res, detail::status_for(err->code), error_body(err->message));
            return;
        }
        detail::json_reply(res, http::status::ok, summary_to_json(std::get<Summary>(found)).dump());
        return;
    }

    // 404
    detail::json_reply(res, http::status::not_found, error_body("not found"));
}

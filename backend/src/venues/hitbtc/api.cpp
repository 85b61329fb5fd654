#include "api.hpp"
#include "parser.hpp"
#include "errors.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>

namespace
{
    // Helper for CURL write callback
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
        size_t new_length = size * nmemb;
        s->append(static_cast<char*>(contents), new_length);
        return new_length;
    }

    struct CurlDeleter {
        void operator()(CURL* c) const { curl_easy_cleanup(c); }
    };

    std::once_flag g_curl_init;

    // simdjson parsers are single-threaded; fetches run on caller threads
    HitbtcParser& local_parser() {
        thread_local HitbtcParser parser;
        return parser;
    }
}

HitbtcApi::HitbtcApi(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string HitbtcApi::get(const std::string& path) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw UpstreamError("curl_easy_init failed");

    const std::string url = base_url_ + "/" + path;
    std::string body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "market-summary/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::cerr << "[hitbtc-rest] CURL error on " << path << ": "
                  << curl_easy_strerror(res) << "\n";
        throw UpstreamError(std::string("GET ") + path + ": " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        // HitBTC explains most failures in an {"error": {...}} body
        std::string message = "HTTP " + std::to_string(status);
        if (auto err = local_parser().exchange_error(body)) {
            message += ": " + *err;
        }
        throw UpstreamError(std::string("GET ") + path + ": " + message);
    }
    return body;
}

RawQuote HitbtcApi::fetch_quote(const std::string& symbol) {
    std::string upper = symbol;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const std::string body = get("public/ticker/" + upper);
    try {
        return local_parser().parse_ticker(body);
    } catch (const DecodeFailure& e) {
        throw UpstreamError(std::string("ticker ") + upper + ": " + e.what());
    }
}

std::vector<SymbolInfo> HitbtcApi::list_symbols() {
    const std::string body = get("public/symbol");
    try {
        return local_parser().parse_symbols(body);
    } catch (const DecodeFailure& e) {
        throw UpstreamError(e.what());
    }
}

std::vector<CurrencyInfo> HitbtcApi::list_currencies() {
    const std::string body = get("public/currency");
    try {
        return local_parser().parse_currencies(body);
    } catch (const DecodeFailure& e) {
        throw UpstreamError(e.what());
    }
}

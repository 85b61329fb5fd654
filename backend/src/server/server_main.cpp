#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "storage.hpp"
#include "md/symbol_directory.hpp"
#include "pipeline/summary_resolver.hpp"
#include "server/app_config.hpp"
#include "server/feed_coordinator.hpp"
#include "server/http_routes.hpp"
#include "server/http_server.hpp"
#include "server/summary_service.hpp"
#include "venues/hitbtc/api.hpp"
#include "venues/hitbtc/ws.hpp"

using tcp = boost::asio::ip::tcp;

namespace {

// Directory from the exchange listings. A failure leaves both tables empty:
// nothing is supported, so nothing is cached and every symbol is reported invalid.
std::shared_ptr<const SymbolDirectory> build_directory(IVenueApi& api, const AppConfig& cfg) {
    std::vector<SymbolInfo> symbols;
    std::vector<CurrencyInfo> currencies;
    try {
        symbols = api.list_symbols();
        std::cout << "[setup] " << api.name() << " lists " << symbols.size() << " symbols" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[setup] Failed to load symbol listing: " << e.what() << std::endl;
    }
    try {
        currencies = api.list_currencies();
    } catch (const std::exception& e) {
        std::cerr << "[setup] Failed to load currency names: " << e.what() << std::endl;
    }
    return std::make_shared<const SymbolDirectory>(symbols, currencies, cfg.symbols);
}

} // namespace

int main() {
    load_env_file();
    const AppConfig cfg = AppConfig::from_env();

    HitbtcApi api(cfg.rest_url, cfg.timeout);
    auto directory = build_directory(api, cfg);
    std::cout << "[setup] " << directory->supported().size() << " supported symbols" << std::endl;

    std::unique_ptr<ISummaryStore> store(make_memory_store());
    SummaryResolver resolver(*store, directory, api,
                             SummaryResolver::Options{cfg.coalesce_misses});

    // Push transport. Without it the server still answers through the resolver.
    HitbtcWs ws(HitbtcWs::Options{cfg.ws_host, cfg.ws_path, cfg.ws_port, cfg.timeout});
    std::unique_ptr<FeedCoordinator> feeds;
    try {
        ws.start();
        feeds = std::make_unique<FeedCoordinator>(*store, directory, ws);
        for (const auto& failure : feeds->start_all()) {
            std::cerr << "[setup] " << to_cstr(failure.error.code) << " for '" << failure.symbol
                      << "': " << failure.error.message << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[setup] Push feed unavailable: " << e.what()
                  << ". Serving from REST only." << std::endl;
    }

    SummaryService service(*store, directory, resolver, feeds.get());

    // HTTP server runs on the main thread
    boost::asio::io_context ioc{1};
    tcp::endpoint ep{boost::asio::ip::make_address(cfg.http_address), cfg.http_port};
    HttpServer server{ioc, ep, [&](auto const& req, auto& res){
        handle_request(service, req, res);
    }};
    server.run();

    std::atomic<bool> stopped{false};
    auto shutdown = [&] {
        if (stopped.exchange(true)) return;
        std::cout << "[setup] Shutting down" << std::endl;
        server.close();
        if (feeds) feeds->shutdown();
        ws.stop();
        ioc.stop();
    };

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](boost::beast::error_code ec, int) {
        if (!ec) shutdown();
    });

    std::cout << "HTTP listening on " << cfg.http_address << ":" << cfg.http_port << std::endl;
    std::cout << "ETHBTC API : http://localhost:" << cfg.http_port << "/currency/ETHBTC" << std::endl;
    std::cout << "All API    : http://localhost:" << cfg.http_port << "/currency/all" << std::endl;

    ioc.run();
    shutdown();
    return 0;
}

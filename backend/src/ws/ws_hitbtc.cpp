#include "venues/hitbtc/ws.hpp"
#include "venues/hitbtc/parser.hpp"
#include "errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <deque>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

struct HitbtcWs::Impl
{
    Options opts;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::unique_ptr<websocket::stream<beast::ssl_stream<tcp::socket>>> ws;
    std::thread io_thread;
    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> stopping{false};

    // I/O thread only
    beast::flat_buffer buffer;
    std::deque<std::string> outbox;
    bool writing{false};
    HitbtcParser parser;

    std::atomic<std::int64_t> next_id{1};
    std::mutex pending_m; // protects pending
    std::unordered_map<std::int64_t, std::shared_ptr<std::promise<HitbtcFrame>>> pending;

    std::mutex channels_m; // protects channels
    std::unordered_map<std::string, std::shared_ptr<UpdateChannel>> channels;
    std::shared_ptr<ErrorChannel> error_feed = std::make_shared<ErrorChannel>();

    explicit Impl(Options o) : opts(std::move(o))
    {
        // Recommended client settings
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    void start()
    {
        if (started.exchange(true)) throw std::runtime_error("hitbtc-ws already started");

        tcp::resolver resolver{ioc};
        auto const results = resolver.resolve(opts.host, std::to_string(opts.port));

        // Make the socket + SSL + WS stack
        ws = std::make_unique<websocket::stream<beast::ssl_stream<tcp::socket>>>(ioc, ssl_ctx);

        // TCP connect
        net::connect(beast::get_lowest_layer(*ws), results);

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), opts.host.c_str())) {
            throw beast::system_error{
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "SNI set failed"
            };
        }

        // SSL handshake
        ws->next_layer().handshake(net::ssl::stream_base::client);

        // WS handshake
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req){
            req.set(http::field::user_agent, std::string("market-summary-ws/1.0"));
        }));
        ws->handshake(opts.host, opts.path);
        ws->text(true);

        connected.store(true, std::memory_order_release);
        std::cout << "[hitbtc-ws] connected to " << opts.host << opts.path << std::endl;

        do_read();
        io_thread = std::thread([this] {
            try {
                ioc.run();
            } catch (const std::exception &e) {
                std::cerr << "[hitbtc-ws] io error: " << e.what() << "\n";
            }
            on_disconnected();
        });
    }

    void do_read()
    {
        ws->async_read(buffer, [this](beast::error_code ec, std::size_t) {
            if (ec) {
                // Expected during stop() or orderly remote shutdown
                if (!stopping.load(std::memory_order_relaxed) &&
                    ec != websocket::error::closed &&
                    ec != net::error::operation_aborted) {
                    std::cerr << "[hitbtc-ws] read error: " << ec.message() << "\n";
                } else if (!stopping.load(std::memory_order_relaxed)) {
                    std::cerr << "[hitbtc-ws] connection closed by remote\n";
                }
                return;
            }
            std::string data = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            on_frame(data);
            do_read();
        });
    }

    void on_frame(const std::string &data)
    {
        HitbtcFrame f;
        try {
            f = parser.parse_frame(data);
        } catch (const DecodeFailure &e) {
            (void)error_feed->try_push(FeedErrorEvent{std::string{}, e.what()});
            return;
        }

        if (f.kind == HitbtcFrame::Kind::Response) {
            std::shared_ptr<std::promise<HitbtcFrame>> p;
            {
                std::lock_guard<std::mutex> lk(pending_m);
                auto it = pending.find(f.id);
                if (it == pending.end()) return; // late answer to a timed-out request
                p = std::move(it->second);
                pending.erase(it);
            }
            p->set_value(std::move(f));
            return;
        }

        if (f.kind == HitbtcFrame::Kind::Ticker) {
            std::shared_ptr<UpdateChannel> ch;
            {
                std::lock_guard<std::mutex> lk(channels_m);
                auto it = channels.find(f.ticker.symbol);
                if (it != channels.end()) ch = it->second;
            }
            if (ch) (void)ch->try_push(std::move(f.ticker));
        }
    }

    void send(std::string text)
    {
        net::post(ioc, [this, text = std::move(text)]() mutable {
            outbox.push_back(std::move(text));
            if (!writing) do_write();
        });
    }

    void do_write()
    {
        writing = true;
        ws->async_write(net::buffer(outbox.front()), [this](beast::error_code ec, std::size_t) {
            if (ec) {
                if (!stopping.load(std::memory_order_relaxed)) {
                    std::cerr << "[hitbtc-ws] write error: " << ec.message() << "\n";
                }
                outbox.clear();
                writing = false;
                return;
            }
            outbox.pop_front();
            if (!outbox.empty()) {
                do_write();
            } else {
                writing = false;
            }
        });
    }

    // Sends one request and waits for the matching response
    HitbtcFrame request(const std::string &method, const std::string &symbol)
    {
        if (!connected.load(std::memory_order_acquire)) {
            throw SubscriptionError(method + " " + symbol + ": not connected");
        }

        const std::int64_t id = next_id.fetch_add(1, std::memory_order_relaxed);
        auto p = std::make_shared<std::promise<HitbtcFrame>>();
        auto fut = p->get_future();
        {
            std::lock_guard<std::mutex> lk(pending_m);
            pending.emplace(id, std::move(p));
        }

        json req = {
            {"method", method},
            {"params", {{"symbol", symbol}}},
            {"id", id},
        };
        send(req.dump());

        if (fut.wait_for(opts.request_timeout) != std::future_status::ready) {
            std::lock_guard<std::mutex> lk(pending_m);
            pending.erase(id);
            throw SubscriptionError(method + " " + symbol + ": timed out");
        }
        HitbtcFrame f = fut.get(); // rethrows when the connection dropped meanwhile
        if (!f.ok) {
            throw SubscriptionError(method + " " + symbol + ": " + f.error);
        }
        return f;
    }

    std::shared_ptr<UpdateChannel> subscribe(const std::string &symbol)
    {
        auto ch = std::make_shared<UpdateChannel>();
        {
            std::lock_guard<std::mutex> lk(channels_m);
            if (channels.count(symbol)) {
                throw SubscriptionError("subscribeTicker " + symbol + ": already subscribed");
            }
            // Registered before the request so no notification after the ack is lost
            channels.emplace(symbol, ch);
        }
        try {
            (void)request("subscribeTicker", symbol);
        } catch (const std::exception &) {
            forget(symbol);
            throw;
        }
        return ch;
    }

    void unsubscribe(const std::string &symbol)
    {
        std::string failure;
        try {
            (void)request("unsubscribeTicker", symbol);
        } catch (const std::exception &e) {
            failure = e.what();
        }
        forget(symbol);
        if (!failure.empty()) throw SubscriptionError(failure);
    }

    void forget(const std::string &symbol)
    {
        std::shared_ptr<UpdateChannel> ch;
        {
            std::lock_guard<std::mutex> lk(channels_m);
            auto it = channels.find(symbol);
            if (it == channels.end()) return;
            ch = std::move(it->second);
            channels.erase(it);
        }
        ch->close();
    }

    // Runs on the I/O thread once ioc.run() returns
    void on_disconnected()
    {
        connected.store(false, std::memory_order_release);

        std::unordered_map<std::int64_t, std::shared_ptr<std::promise<HitbtcFrame>>> waiting;
        {
            std::lock_guard<std::mutex> lk(pending_m);
            waiting.swap(pending);
        }
        for (auto &kv : waiting) {
            kv.second->set_exception(std::make_exception_ptr(
                SubscriptionError("connection closed before the exchange answered")));
        }

        std::unordered_map<std::string, std::shared_ptr<UpdateChannel>> open;
        {
            std::lock_guard<std::mutex> lk(channels_m);
            open.swap(channels);
        }
        for (auto &kv : open) {
            kv.second->close();
        }
        error_feed->close();

        if (!stopping.load(std::memory_order_relaxed)) {
            std::cerr << "[hitbtc-ws] disconnected; " << open.size() << " channel(s) closed\n";
        }
    }

    void stop() noexcept
    {
        if (stopping.exchange(true)) return;
        if (ws && io_thread.joinable()) {
            net::post(ioc, [this] {
                beast::error_code ec;
                tcp::socket &sock = beast::get_lowest_layer(*ws);
                sock.shutdown(tcp::socket::shutdown_both, ec);
                sock.close(ec);
                ioc.stop(); // abandon the websocket timers still queued
            });
            if (io_thread.get_id() != std::this_thread::get_id()) io_thread.join();
        } else {
            on_disconnected();
        }
    }
};

HitbtcWs::HitbtcWs(Options opts) : impl_(new Impl(std::move(opts))) {}
HitbtcWs::~HitbtcWs()
{
    impl_->stop();
    delete impl_;
}

// The outer class methods just forward to the implementation
void HitbtcWs::start() { impl_->start(); }
void HitbtcWs::stop() noexcept { impl_->stop(); }
bool HitbtcWs::connected() const noexcept { return impl_->connected.load(std::memory_order_acquire); }

std::shared_ptr<UpdateChannel> HitbtcWs::subscribe(const std::string &symbol) { return impl_->subscribe(symbol); }
void HitbtcWs::unsubscribe(const std::string &symbol) { impl_->unsubscribe(symbol); }
std::shared_ptr<ErrorChannel> HitbtcWs::errors() { return impl_->error_feed; }

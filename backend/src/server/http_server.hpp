#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// HTTP/1.1 server honoring keep-alive. Handlers run on the io_context threads:
// with the single-threaded io_context of server_main, a blocking cache-miss fetch
// holds up every other request, cache hits included.
// Handler exceptions become a 500 so one bad request cannot take the server down.
class HttpServer {
public:
    using HandlerFn = std::function<void(const http::request<http::string_body>&, http::response<http::string_body>&)>;

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler)
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)) {
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("bind " + ep.address().to_string() + ":" +
                                         std::to_string(ep.port()) + ": " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen: " + ec.message());
    }

    void run() { do_accept(); }

    // Stops accepting; open sessions finish when the io_context stops.
    void close() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    struct Session : public std::enable_shared_from_this<Session> {
        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        HttpServer::HandlerFn handler_;
        http::request<http::string_body> req_;

        Session(tcp::socket s, HandlerFn h) : stream_(std::move(s)), handler_(std::move(h)) {}

        void run() {
            boost::asio::dispatch(stream_.get_executor(),
                [self = shared_from_this()] { self->do_read(); });
        }

        void do_read() {
            req_ = {};
            stream_.expires_after(std::chrono::seconds(30));
            http::async_read(stream_, buffer_, req_,
                [self = shared_from_this()](boost::beast::error_code ec, std::size_t) {
                    if (ec == http::error::end_of_stream) return self->do_close();
                    if (ec) return; // timeout or reset
                    self->on_request();
                });
        }

        void on_request() {
            auto res = std::make_shared<http::response<http::string_body>>();
            res->version(req_.version());
            res->keep_alive(req_.keep_alive());
            try {
                handler_(req_, *res);
            } catch (const std::exception& e) {
                std::cerr << "[http] handler error on " << req_.target() << ": " << e.what() << "\n";
                res->result(http::status::internal_server_error);
                res->set(http::field::content_type, "application/json");
                res->body() = R"({"error":"internal error"})";
            }
            // CORS
            res->set(http::field::access_control_allow_origin, "*");
            res->set(http::field::access_control_allow_headers, "*");
            res->set(http::field::access_control_allow_methods, "GET, OPTIONS");
            res->prepare_payload();

            http::async_write(stream_, *res,
                [self = shared_from_this(), res](boost::beast::error_code ec, std::size_t) {
                    if (ec) return;
                    if (!res->keep_alive()) return self->do_close();
                    self->do_read();
                });
        }

        void do_close() {
            boost::beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s){
                if (ec == boost::asio::error::operation_aborted) return; // closed
                if (!ec) std::make_shared<Session>(std::move(s), handler_)->run();
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
};

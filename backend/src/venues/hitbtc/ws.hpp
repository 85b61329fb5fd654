#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "venues/market_ws.hpp"

// JSON-RPC 2.0 ticker subscriptions over the HitBTC socket.
// start() connects and spawns the I/O thread; stop() closes the socket, joins the
// thread and closes every channel. There is no reconnect: after a drop every
// channel is closed and subscribe() fails until a new HitbtcWs is started.
// NOTE: PIMPL hides Boost and OpenSSL headers from dependents.
class HitbtcWs final : public IMarketWs {
public:
    struct Options {
        std::string host{"api.hitbtc.com"};
        std::string path{"/api/2/ws"};
        unsigned short port{443};
        std::chrono::milliseconds request_timeout{std::chrono::seconds(10)};
    };

    explicit HitbtcWs(Options opts);
    ~HitbtcWs();
    HitbtcWs(const HitbtcWs &) = delete;
    HitbtcWs &operator=(const HitbtcWs &) = delete;

    void start();          // throws std::runtime_error when the handshake fails
    void stop() noexcept;  // idempotent
    bool connected() const noexcept;

    std::shared_ptr<UpdateChannel> subscribe(const std::string &symbol) override;
    void unsubscribe(const std::string &symbol) override;
    std::shared_ptr<ErrorChannel> errors() override;

private:
    struct Impl;
    Impl *impl_;
};

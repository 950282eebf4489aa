#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "prism/core/config.hpp"
#include "prism/core/error.hpp"
#include "prism/server/routes.hpp"

namespace prism::server {

namespace net = boost::asio;
using tcp = net::ip::tcp;

/// HTTP/1.1 front end (Boost.Beast). Each connection runs as its own
/// coroutine; keep-alive is honoured and bodies above max_body_bytes are
/// answered with 413.
class HttpServer {
public:
    HttpServer(net::io_context& ioc, ServerConfig config, Router& router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Binds and listens. Port 0 picks an ephemeral port.
    auto listen() -> Result<void>;

    /// Accepts connections until stop().
    auto run() -> awaitable<void>;

    /// Stops accepting; in-flight requests finish.
    void stop();

    /// The bound port (valid after listen()).
    [[nodiscard]] auto port() const -> uint16_t;
    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

private:
    auto handle_session(tcp::socket socket) -> awaitable<void>;

    net::io_context& ioc_;
    ServerConfig config_;
    Router& router_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::atomic<bool> running_{false};
};

} // namespace prism::server

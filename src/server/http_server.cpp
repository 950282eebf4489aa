#include "prism/server/http_server.hpp"
#include "prism/core/logger.hpp"
#include "prism/core/utils.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>

namespace prism::server {

namespace beast = boost::beast;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

auto to_http(const ApiResponse& api, unsigned version, bool keep_alive)
    -> http::response<http::string_body> {
    http::response<http::string_body> res{api.status, version};
    res.set(http::field::server, "prism/1.0");
    res.set(http::field::content_type, api.content_type);
    for (const auto& [name, value] : api.headers) {
        res.set(name, value);
    }
    res.keep_alive(keep_alive);
    res.body() = api.body;
    res.prepare_payload();
    return res;
}

} // anonymous namespace

HttpServer::HttpServer(net::io_context& ioc, ServerConfig config, Router& router)
    : ioc_(ioc), config_(std::move(config)), router_(router) {}

// The io_context is no longer running by the time the server is destroyed.
HttpServer::~HttpServer() {
    running_ = false;
    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
}

auto HttpServer::listen() -> Result<void> {
    try {
        auto address = net::ip::make_address(config_.host);
        tcp::endpoint endpoint{address, config_.port};

        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        acceptor_.reset();
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to listen on " + config_.host + ":" + std::to_string(config_.port),
            e.what()));
    }

    running_ = true;
    LOG_INFO("HTTP server listening on {}:{}", config_.host, port());
    return {};
}

auto HttpServer::port() const -> uint16_t {
    if (!acceptor_) return config_.port;
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? config_.port : endpoint.port();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    LOG_INFO("HTTP server stopping");
    net::post(acceptor_->get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_->close(ec);
    });
}

auto HttpServer::run() -> awaitable<void> {
    while (running_) {
        auto [ec, socket] = co_await acceptor_->async_accept(
            net::as_tuple(net::use_awaitable));
        if (ec) {
            if (!running_) break;   // acceptor closed by stop()
            LOG_ERROR("Accept error: {}", ec.message());
            continue;
        }
        net::co_spawn(ioc_, handle_session(std::move(socket)), net::detached);
    }
}

auto HttpServer::handle_session(tcp::socket socket) -> awaitable<void> {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    while (true) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(config_.max_body_bytes);

        stream.expires_after(kReadTimeout);
        auto [read_ec, bytes] = co_await http::async_read(
            stream, buffer, parser, net::as_tuple(net::use_awaitable));

        if (read_ec == http::error::body_limit) {
            LOG_WARN("Rejected request body over {} bytes", config_.max_body_bytes);
            auto res = to_http(json_error(http::status::payload_too_large, "PAYLOAD_TOO_LARGE",
                                          "Request body exceeds the size limit"),
                               11, false);
            auto [ec, n] = co_await http::async_write(stream, res,
                net::as_tuple(net::use_awaitable));
            if (ec) LOG_DEBUG("Failed to send 413: {}", ec.message());
            break;
        }
        if (read_ec) {
            if (read_ec != http::error::end_of_stream &&
                read_ec != beast::error::timeout &&
                read_ec != net::error::connection_reset) {
                LOG_DEBUG("HTTP read error: {}", read_ec.message());
            }
            break;
        }

        auto request = parser.release();
        auto started = std::chrono::steady_clock::now();

        // Renders can outlast the read timeout.
        stream.expires_never();

        ApiResponse api;
        try {
            api = co_await router_.handle(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled error for {}: {}", std::string_view(request.target()), e.what());
            api = json_error(http::status::internal_server_error, "INTERNAL_ERROR",
                             "Internal server error");
        }

        auto keep_alive = request.keep_alive();
        auto res = to_http(api, request.version(), keep_alive);

        std::string_view method = request.method_string();
        LOG_INFO("{} {} -> {} ({}ms)", method, std::string_view(request.target()),
                 static_cast<unsigned>(api.status), utils::elapsed_ms(started));

        auto [write_ec, written] = co_await http::async_write(
            stream, res, net::as_tuple(net::use_awaitable));
        if (write_ec) {
            LOG_DEBUG("HTTP write error: {}", write_ec.message());
            break;
        }
        if (!keep_alive) break;
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace prism::server

#include "prism/browser/cdp_client.hpp"
#include "prism/core/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace prism::browser {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Full-page captures arrive as a single base64 message.
constexpr size_t kMaxMessageBytes = 256 * 1024 * 1024;

using ResultChannel = net::experimental::concurrent_channel<void(
    boost::system::error_code, Result<json>)>;

// One-slot channel used as an async mutex: sending takes the lock (and
// suspends while it is held), receiving gives it back.
using WriteLock = net::experimental::concurrent_channel<void(boost::system::error_code)>;

} // anonymous namespace

// ---------------------------------------------------------------------------
// CdpClient::Impl
// ---------------------------------------------------------------------------

struct CdpClient::Impl {
    net::io_context& ioc;
    net::strand<net::io_context::executor_type> strand;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    // Beast allows one outstanding write (or close) per stream. The strand
    // only serializes handlers, so whole writes are serialized here.
    WriteLock write_lock;
    std::string url;
    std::atomic<bool> connected{false};
    std::atomic<int> next_id{1};
    std::atomic<int64_t> default_timeout_ms{30000};

    mutable std::mutex pending_mutex;
    std::unordered_map<int, std::function<void(Result<json>)>> pending_commands;

    explicit Impl(net::io_context& ctx)
        : ioc(ctx), strand(net::make_strand(ctx)), write_lock(ctx, 1) {}

    auto lock_writes() -> awaitable<void> {
        co_await write_lock.async_send(boost::system::error_code{}, net::use_awaitable);
    }

    void unlock_writes() {
        write_lock.try_receive([](boost::system::error_code) {});
    }

    auto allocate_id() -> int {
        return next_id.fetch_add(1, std::memory_order_relaxed);
    }

    /// Completes a pending command exactly once; later completions are dropped.
    void complete(int id, Result<json> result) {
        std::function<void(Result<json>)> callback;
        {
            std::lock_guard lock(pending_mutex);
            auto it = pending_commands.find(id);
            if (it == pending_commands.end()) return;
            callback = std::move(it->second);
            pending_commands.erase(it);
        }
        callback(std::move(result));
    }

    void fail_all(const Error& error) {
        std::unordered_map<int, std::function<void(Result<json>)>> drained;
        {
            std::lock_guard lock(pending_mutex);
            drained.swap(pending_commands);
        }
        for (auto& [id, callback] : drained) {
            callback(std::unexpected(error));
        }
    }

    void dispatch_message(const std::string& msg) {
        try {
            auto j = json::parse(msg);

            if (!j.contains("id")) {
                // Event notifications are not consumed; pages poll instead.
                LOG_TRACE("CDP event: {}", j.value("method", "?"));
                return;
            }

            int id = j["id"].get<int>();
            if (j.contains("error")) {
                auto& err = j["error"];
                complete(id, std::unexpected(
                    make_error(ErrorCode::ProtocolError,
                               err.value("message", "CDP error"),
                               err.contains("data") ? err["data"].dump() : "")));
            } else {
                complete(id, j.value("result", json::object()));
            }
        } catch (const json::exception& e) {
            LOG_WARN("Failed to parse CDP message: {}", e.what());
        }
    }

    static auto read_loop(std::shared_ptr<Impl> self) -> awaitable<void> {
        beast::flat_buffer buffer;
        while (true) {
            auto [ec, n] = co_await self->ws->async_read(
                buffer, net::as_tuple(net::use_awaitable));
            if (ec) {
                if (ec != websocket::error::closed && self->connected) {
                    LOG_WARN("CDP read error on {}: {}", self->url, ec.message());
                }
                break;
            }
            auto msg = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            self->dispatch_message(msg);
        }

        self->connected = false;
        self->fail_all(make_error(ErrorCode::ConnectionClosed, "CDP connection closed"));
    }
};

// ---------------------------------------------------------------------------
// CdpClient
// ---------------------------------------------------------------------------

CdpClient::CdpClient(boost::asio::io_context& ioc)
    : impl_(std::make_shared<Impl>(ioc)) {}

CdpClient::~CdpClient() {
    if (!impl_ || !impl_->connected.exchange(false)) return;

    // The read loop holds its own reference to Impl; closing the socket on
    // the strand makes it exit and fail whatever is still pending.
    net::post(impl_->strand, [impl = impl_]() {
        if (impl->ws) {
            beast::error_code ec;
            beast::get_lowest_layer(*impl->ws).socket().close(ec);
        }
    });
}

auto CdpClient::connect(std::string_view ws_url) -> awaitable<Result<void>> {
    auto impl = impl_;
    impl->url = std::string(ws_url);

    try {
        // Parse the WebSocket URL: ws://host:port/path
        std::string url_str(ws_url);
        size_t start = 0;
        if (url_str.starts_with("ws://")) {
            start = 5;
        } else if (url_str.starts_with("wss://")) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument,
                "TLS DevTools endpoints are not supported", url_str));
        }

        auto path_pos = url_str.find('/', start);
        auto host_port = url_str.substr(start, path_pos - start);
        std::string target = (path_pos != std::string::npos) ? url_str.substr(path_pos) : "/";

        std::string host = host_port;
        std::string port = "9222";
        if (auto colon_pos = host_port.find(':'); colon_pos != std::string::npos) {
            host = host_port.substr(0, colon_pos);
            port = host_port.substr(colon_pos + 1);
        }

        tcp::resolver resolver(impl->ioc);
        auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

        impl->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(impl->strand);

        beast::get_lowest_layer(*impl->ws).expires_after(std::chrono::seconds(30));
        auto ep = co_await beast::get_lowest_layer(*impl->ws).async_connect(
            results, net::use_awaitable);

        // Chrome rejects Host headers that are not an IP or localhost.
        auto host_str = host + ":" + std::to_string(ep.port());

        beast::get_lowest_layer(*impl->ws).expires_never();
        impl->ws->set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));
        impl->ws->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "prism-cdp/1.0");
            }));
        impl->ws->read_message_max(kMaxMessageBytes);

        co_await impl->ws->async_handshake(host_str, target, net::use_awaitable);
        impl->ws->text(true);

        impl->connected = true;
        LOG_DEBUG("CDP connected to {}", url_str);

        net::co_spawn(impl->strand, Impl::read_loop(impl), net::detached);
        co_return ok_result();
    } catch (const boost::system::system_error& se) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed,
                       "Failed to connect to CDP",
                       se.what()));
    }
}

auto CdpClient::send_command(std::string_view method, json params,
                             std::string_view session_id,
                             std::chrono::milliseconds timeout)
    -> awaitable<Result<json>> {
    auto impl = impl_;
    if (!impl->connected) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed,
                       "CDP client not connected",
                       std::string(method)));
    }

    int id = impl->allocate_id();

    json message = {
        {"id", id},
        {"method", std::string(method)},
        {"params", std::move(params)},
    };
    if (!session_id.empty()) {
        message["sessionId"] = std::string(session_id);
    }

    auto channel = std::make_shared<ResultChannel>(impl->ioc, 1);
    {
        std::lock_guard lock(impl->pending_mutex);
        impl->pending_commands[id] = [channel](Result<json> result) {
            channel->try_send(boost::system::error_code{}, std::move(result));
        };
    }

    // Writes go through the strand that owns the stream.
    auto write_ec = co_await net::co_spawn(impl->strand,
        [impl, payload = message.dump()]() -> awaitable<boost::system::error_code> {
            co_await impl->lock_writes();
            auto [ec, n] = co_await impl->ws->async_write(
                net::buffer(payload), net::as_tuple(net::use_awaitable));
            impl->unlock_writes();
            co_return ec;
        },
        net::use_awaitable);

    if (write_ec) {
        {
            std::lock_guard lock(impl->pending_mutex);
            impl->pending_commands.erase(id);
        }
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed,
                       "Failed to send CDP command",
                       write_ec.message()));
    }

    auto limit = timeout.count() > 0
        ? timeout
        : std::chrono::milliseconds(impl->default_timeout_ms.load());
    auto timer = std::make_shared<net::steady_timer>(
        co_await net::this_coro::executor, limit);
    timer->async_wait([impl, id, name = std::string(method), limit](boost::system::error_code ec) {
        if (ec) return;
        impl->complete(id, std::unexpected(
            make_error(ErrorCode::Timeout, "CDP command timed out",
                       name + " after " + std::to_string(limit.count()) + "ms")));
    });

    auto result = co_await channel->async_receive(net::use_awaitable);
    timer->cancel();
    co_return result;
}

auto CdpClient::disconnect() -> awaitable<void> {
    auto impl = impl_;
    if (!impl->connected.exchange(false)) {
        co_return;
    }

    co_await net::co_spawn(impl->strand,
        [impl]() -> awaitable<void> {
            if (impl->ws) {
                co_await impl->lock_writes();
                auto [ec] = co_await impl->ws->async_close(
                    websocket::close_code::normal, net::as_tuple(net::use_awaitable));
                impl->unlock_writes();
                if (ec) {
                    LOG_DEBUG("CDP close error (peer likely gone): {}", ec.message());
                }
            }
        },
        net::use_awaitable);

    LOG_DEBUG("CDP disconnected from {}", impl->url);
}

void CdpClient::set_default_timeout(std::chrono::milliseconds timeout) {
    impl_->default_timeout_ms = timeout.count();
}

auto CdpClient::is_connected() const -> bool {
    return impl_ && impl_->connected;
}

auto CdpClient::ws_url() const -> std::string {
    return impl_->url;
}

} // namespace prism::browser

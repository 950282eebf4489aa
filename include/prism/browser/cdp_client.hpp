#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include "prism/core/error.hpp"

namespace prism::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Chrome DevTools Protocol WebSocket client.
/// Communicates with a Chrome/Chromium instance over the CDP WebSocket interface.
///
/// All socket I/O runs on a private strand, so the client may be used from
/// coroutines on a multi-threaded io_context. Concurrent commands are
/// allowed; their frames are written one at a time.
class CdpClient {
public:
    explicit CdpClient(boost::asio::io_context& ioc);
    ~CdpClient();

    CdpClient(const CdpClient&) = delete;
    CdpClient& operator=(const CdpClient&) = delete;

    /// Connect to the browser-level DevTools WebSocket endpoint.
    auto connect(std::string_view ws_url) -> awaitable<Result<void>>;

    /// Send a CDP command and await its result.
    /// method: CDP method name (e.g. "Page.navigate", "Runtime.evaluate").
    /// session_id: flattened target session, empty for browser-level commands.
    /// timeout: zero uses the client default; expiry yields ErrorCode::Timeout.
    auto send_command(std::string_view method, json params = json::object(),
                      std::string_view session_id = {},
                      std::chrono::milliseconds timeout = {})
        -> awaitable<Result<json>>;

    /// Disconnect from the Chrome DevTools endpoint.
    auto disconnect() -> awaitable<void>;

    /// Default per-command timeout (30s unless changed).
    void set_default_timeout(std::chrono::milliseconds timeout);

    /// Returns true if the client is currently connected.
    [[nodiscard]] auto is_connected() const -> bool;

    /// Get the WebSocket URL this client is connected to.
    [[nodiscard]] auto ws_url() const -> std::string;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace prism::browser

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "prism/browser/cdp_client.hpp"

using namespace prism;
using namespace prism::browser;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using std::chrono::milliseconds;

namespace {

/// Minimal DevTools peer. Echoes each command back as its result, except:
///   Test.fail    -> CDP error reply
///   Test.silent  -> no reply
///   Test.hangup  -> closes the WebSocket
/// Every reply is preceded by an unsolicited event.
auto serve_devtools(tcp::acceptor& acceptor) -> awaitable<void> {
    auto socket = co_await acceptor.async_accept(net::use_awaitable);
    websocket::stream<beast::tcp_stream> ws(std::move(socket));
    co_await ws.async_accept(net::use_awaitable);
    ws.text(true);

    beast::flat_buffer buffer;
    while (true) {
        auto [ec, n] = co_await ws.async_read(buffer, net::as_tuple(net::use_awaitable));
        if (ec) break;
        auto message = json::parse(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());

        auto method = message["method"].get<std::string>();
        if (method == "Test.silent") continue;
        if (method == "Test.hangup") {
            auto [close_ec] = co_await ws.async_close(websocket::close_code::normal,
                                                      net::as_tuple(net::use_awaitable));
            break;
        }

        json event = {{"method", "Page.loadEventFired"}, {"params", {{"timestamp", 1.0}}}};
        co_await ws.async_write(net::buffer(event.dump()), net::use_awaitable);

        json reply = {{"id", message["id"]}};
        if (method == "Test.fail") {
            reply["error"] = {{"code", -32000}, {"message", "No target with given id found"}};
        } else {
            reply["result"] = {
                {"method", method},
                {"params", message["params"]},
                {"sessionId", message.value("sessionId", "")},
            };
        }
        co_await ws.async_write(net::buffer(reply.dump()), net::use_awaitable);
    }
}

} // namespace

TEST_CASE("CdpClient exchanges commands with a DevTools endpoint", "[browser][cdp]") {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    auto port = acceptor.local_endpoint().port();
    net::co_spawn(ioc, serve_devtools(acceptor), net::detached);

    CdpClient client(ioc);
    std::optional<Result<void>> connected;
    std::optional<Result<json>> echoed;
    std::optional<Result<json>> session;
    std::optional<Result<json>> failed;
    std::optional<Result<json>> silent;
    std::optional<Result<json>> hung_up;
    std::optional<Result<json>> after_close;

    net::co_spawn(ioc,
        [&]() -> awaitable<void> {
            auto url = "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser/test";
            connected = co_await client.connect(url);
            if (!*connected) co_return;

            echoed = co_await client.send_command("Page.navigate", {{"url", "about:blank"}});
            session = co_await client.send_command("Runtime.evaluate",
                                                   {{"expression", "1+1"}}, "SESSION-1");
            failed = co_await client.send_command("Test.fail");
            silent = co_await client.send_command("Test.silent", json::object(), {},
                                                  milliseconds(50));
            hung_up = co_await client.send_command("Test.hangup");
            after_close = co_await client.send_command("Page.navigate");
        },
        net::detached);
    ioc.run();

    REQUIRE(connected.has_value());
    REQUIRE(connected->has_value());
    CHECK(client.ws_url() == "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser/test");

    SECTION("results are matched to their command ids") {
        REQUIRE(echoed.has_value());
        REQUIRE(echoed->has_value());
        CHECK((**echoed)["method"] == "Page.navigate");
        CHECK((**echoed)["params"]["url"] == "about:blank");
        CHECK((**echoed)["sessionId"] == "");

        REQUIRE(session->has_value());
        CHECK((**session)["sessionId"] == "SESSION-1");
    }

    SECTION("CDP errors become ProtocolError") {
        REQUIRE(failed.has_value());
        REQUIRE_FALSE(failed->has_value());
        CHECK(failed->error().code() == ErrorCode::ProtocolError);
        CHECK(failed->error().message() == "No target with given id found");
    }

    SECTION("unanswered commands time out") {
        REQUIRE(silent.has_value());
        REQUIRE_FALSE(silent->has_value());
        CHECK(silent->error().code() == ErrorCode::Timeout);
    }

    SECTION("a dropped connection fails pending and later commands") {
        REQUIRE(hung_up.has_value());
        REQUIRE_FALSE(hung_up->has_value());
        CHECK(hung_up->error().code() == ErrorCode::ConnectionClosed);

        REQUIRE(after_close.has_value());
        REQUIRE_FALSE(after_close->has_value());
        CHECK(after_close->error().code() == ErrorCode::ConnectionClosed);
        CHECK_FALSE(client.is_connected());
    }
}

TEST_CASE("CdpClient serializes concurrent commands on one connection", "[browser][cdp]") {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    auto port = acceptor.local_endpoint().port();
    net::co_spawn(ioc, serve_devtools(acceptor), net::detached);

    constexpr int kCommands = 32;
    CdpClient client(ioc);
    std::optional<Result<void>> connected;
    std::vector<std::optional<Result<json>>> results(kCommands);
    int done = 0;

    net::co_spawn(ioc,
        [&]() -> awaitable<void> {
            connected = co_await client.connect(
                "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser/test");
            if (!*connected) co_return;

            auto executor = co_await net::this_coro::executor;
            for (int i = 0; i < kCommands; ++i) {
                net::co_spawn(executor,
                    [&, i]() -> awaitable<void> {
                        results[i] = co_await client.send_command(
                            "Runtime.evaluate", {{"expression", std::to_string(i)}});
                        if (++done == kCommands) co_await client.disconnect();
                    },
                    net::detached);
            }
        },
        net::detached);
    ioc.run();

    REQUIRE(connected.has_value());
    REQUIRE(connected->has_value());
    CHECK(done == kCommands);
    for (int i = 0; i < kCommands; ++i) {
        REQUIRE(results[i].has_value());
        REQUIRE(results[i]->has_value());
        CHECK((**results[i])["params"]["expression"] == std::to_string(i));
    }
    CHECK_FALSE(client.is_connected());
}

TEST_CASE("CdpClient connection failures", "[browser][cdp]") {
    net::io_context ioc;
    CdpClient client(ioc);

    SECTION("commands before connect") {
        std::optional<Result<json>> result;
        net::co_spawn(ioc,
            [&]() -> awaitable<void> { result = co_await client.send_command("Browser.getVersion"); },
            net::detached);
        ioc.run();
        REQUIRE(result.has_value());
        CHECK(result->error().code() == ErrorCode::ConnectionClosed);
    }

    SECTION("nothing listening") {
        // Bind then close to get a port that is very likely free.
        uint16_t port = 0;
        {
            tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
            port = scratch.local_endpoint().port();
        }
        std::optional<Result<void>> result;
        net::co_spawn(ioc,
            [&]() -> awaitable<void> {
                result = co_await client.connect("ws://127.0.0.1:" + std::to_string(port) + "/x");
            },
            net::detached);
        ioc.run();
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->has_value());
        CHECK(result->error().code() == ErrorCode::ConnectionFailed);
        CHECK_FALSE(client.is_connected());
    }

    SECTION("TLS endpoints are rejected") {
        std::optional<Result<void>> result;
        net::co_spawn(ioc,
            [&]() -> awaitable<void> { result = co_await client.connect("wss://example.com/x"); },
            net::detached);
        ioc.run();
        REQUIRE(result.has_value());
        CHECK(result->error().code() == ErrorCode::InvalidArgument);
    }
}

#include <catch2/catch_test_macros.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "prism/browser/browser_pool.hpp"
#include "prism/server/http_server.hpp"
#include "../browser/fake_browser.hpp"

using namespace prism;
using namespace prism::server;
namespace beast = boost::beast;
using json = nlohmann::json;

namespace {

struct ServerFixture {
    boost::asio::io_context ioc;
    std::shared_ptr<prism::test::FakeBrowserState> state =
        std::make_shared<prism::test::FakeBrowserState>();
    browser::BrowserPool pool{ioc, PoolConfig{},
                              std::make_shared<prism::test::FakeLauncher>(state)};
    render::RenderingService renderer{pool, RenderConfig{}};
    render::BatchCoordinator batch{renderer, 2};
    render::HealthReporter health{pool};
    Router router{renderer, batch, health};
    std::unique_ptr<HttpServer> server;

    explicit ServerFixture(size_t max_body = 1024 * 1024) {
        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.max_body_bytes = max_body;
        server = std::make_unique<HttpServer>(ioc, config, router);
    }
};

auto exchange(uint16_t port, http::request<http::string_body> request)
    -> awaitable<http::response<http::string_body>> {
    auto executor = co_await boost::asio::this_coro::executor;
    beast::tcp_stream stream(executor);
    co_await stream.async_connect(
        tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port),
        boost::asio::use_awaitable);

    request.set(http::field::host, "127.0.0.1");
    request.prepare_payload();
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}

} // namespace

TEST_CASE("HttpServer serves requests over TCP", "[server][http]") {
    ServerFixture fx;
    REQUIRE(fx.server->listen().has_value());
    REQUIRE(fx.server->is_running());
    auto port = fx.server->port();
    REQUIRE(port != 0);

    boost::asio::co_spawn(fx.ioc, fx.server->run(), boost::asio::detached);

    std::optional<http::response<http::string_body>> health;
    std::optional<http::response<http::string_body>> shot;
    boost::asio::co_spawn(fx.ioc,
        [&]() -> awaitable<void> {
            http::request<http::string_body> get{http::verb::get, "/health", 11};
            health = co_await exchange(port, std::move(get));

            http::request<http::string_body> post{http::verb::post, "/render/screenshot", 11};
            post.set(http::field::content_type, "application/json");
            post.body() = R"({"htmlContent":"<h1>wire</h1>"})";
            shot = co_await exchange(port, std::move(post));

            fx.server->stop();
            co_await fx.pool.shutdown();
        },
        boost::asio::detached);
    fx.ioc.run();

    REQUIRE(health.has_value());
    CHECK(health->result() == http::status::ok);
    CHECK(json::parse(health->body())["status"] == "healthy");

    REQUIRE(shot.has_value());
    CHECK(shot->result() == http::status::ok);
    CHECK(shot->at(http::field::content_type) == "image/png");
    CHECK(shot->body() == prism::test::kFakePng);
    CHECK_FALSE(fx.server->is_running());
}

TEST_CASE("HttpServer rejects oversized bodies with 413", "[server][http]") {
    ServerFixture fx(64);
    REQUIRE(fx.server->listen().has_value());
    auto port = fx.server->port();
    boost::asio::co_spawn(fx.ioc, fx.server->run(), boost::asio::detached);

    std::optional<http::response<http::string_body>> response;
    boost::asio::co_spawn(fx.ioc,
        [&]() -> awaitable<void> {
            http::request<http::string_body> post{http::verb::post, "/render/screenshot", 11};
            post.body() = R"({"htmlContent":")" + std::string(200, 'x') + R"("})";
            response = co_await exchange(port, std::move(post));
            fx.server->stop();
            co_await fx.pool.shutdown();
        },
        boost::asio::detached);
    fx.ioc.run();

    REQUIRE(response.has_value());
    CHECK(response->result() == http::status::payload_too_large);
    CHECK(json::parse(response->body())["error"]["code"] == "PAYLOAD_TOO_LARGE");
    CHECK(fx.state->launches == 0);
}

TEST_CASE("HttpServer reports bind failures", "[server][http]") {
    ServerFixture first;
    REQUIRE(first.server->listen().has_value());

    boost::asio::io_context ioc;
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = first.server->port();
    HttpServer second(ioc, config, first.router);

    // SO_REUSEADDR does not allow two listeners on one port.
    auto result = second.listen();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::IoError);
}

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>

#include "prism/core/error.hpp"
#include "prism/render/batch_coordinator.hpp"
#include "prism/render/health.hpp"
#include "prism/render/rendering_service.hpp"
#include "prism/render/types.hpp"

namespace prism::server {

using boost::asio::awaitable;
namespace http = boost::beast::http;

/// Response produced by a route, before it is framed as HTTP.
struct ApiResponse {
    http::status status = http::status::ok;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

/// A request the server refuses before doing any work.
struct RequestError {
    http::status status = http::status::bad_request;
    std::string code;       // e.g. "MISSING_HTML_CONTENT"
    std::string message;
};

template <typename T>
using Parsed = std::expected<T, RequestError>;

/// HTTP status for a failed render.
auto status_for_error(ErrorCode code) -> http::status;

/// `{success:false, error:{code, message}}`.
auto json_error(http::status status, std::string_view code, std::string_view message)
    -> ApiResponse;

auto error_response(const RequestError& error) -> ApiResponse;

/// True when the Accept header asks for JSON instead of raw bytes.
auto wants_json(std::string_view accept) -> bool;

/// Parses `{htmlContent, options}`.
auto parse_render_body(std::string_view body, render::RenderKind kind)
    -> Parsed<render::RenderRequest>;

/// Parses `{requests:[{htmlContent, options}]}` as screenshot requests.
auto parse_batch_body(std::string_view body) -> Parsed<std::vector<render::RenderRequest>>;

/// Successful results become the raw artifact (or base64 JSON when
/// `as_json`); failures become a JSON error with the mapped status.
auto render_response(const render::RenderResult& result, bool as_json,
                     std::optional<std::string> attachment_name = std::nullopt)
    -> ApiResponse;

/// Dispatches requests to the rendering services.
///
/// Routes:
///   POST /render/screenshot         {htmlContent, options}
///   POST /render/pdf                {htmlContent, options}
///   POST /render/slide-pdf          {htmlContent}
///   POST /render/screenshot/batch   {requests:[{htmlContent, options}]}
///   GET  /health
class Router {
public:
    Router(render::RenderingService& renderer, render::BatchCoordinator& batch,
           const render::HealthReporter& health);

    auto handle(const http::request<http::string_body>& request) -> awaitable<ApiResponse>;

private:
    auto render_single(const http::request<http::string_body>& request,
                       render::RenderKind kind, bool slide) -> awaitable<ApiResponse>;
    auto render_batch(const http::request<http::string_body>& request)
        -> awaitable<ApiResponse>;

    render::RenderingService& renderer_;
    render::BatchCoordinator& batch_;
    const render::HealthReporter& health_;
};

} // namespace prism::server

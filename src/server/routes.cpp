#include "prism/server/routes.hpp"
#include "prism/core/logger.hpp"
#include "prism/core/utils.hpp"

#include <nlohmann/json.hpp>

namespace prism::server {

using json = nlohmann::json;

namespace {

auto missing_html() -> RequestError {
    return {http::status::bad_request, "MISSING_HTML_CONTENT", "htmlContent is required"};
}

auto parse_json(std::string_view body) -> Parsed<json> {
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::unexpected(RequestError{http::status::bad_request, "INVALID_JSON",
                                            "Request body must be a JSON object"});
    }
    return parsed;
}

auto build_request(const json& item, render::RenderKind kind) -> Parsed<render::RenderRequest> {
    if (!item.is_object() || !item.contains("htmlContent") ||
        !item["htmlContent"].is_string() || item["htmlContent"].get_ref<const std::string&>().empty()) {
        return std::unexpected(missing_html());
    }

    render::RenderRequest request;
    request.html = item["htmlContent"].get<std::string>();
    request.kind = kind;

    auto options = item.contains("options") ? item["options"] : json();
    if (kind == render::RenderKind::Screenshot) {
        auto parsed = render::parse_screenshot_options(options);
        if (!parsed) {
            return std::unexpected(RequestError{http::status::bad_request, "INVALID_OPTIONS",
                                                parsed.error().what()});
        }
        request.screenshot = std::move(*parsed);
    } else {
        auto parsed = render::parse_pdf_options(options);
        if (!parsed) {
            return std::unexpected(RequestError{http::status::bad_request, "INVALID_OPTIONS",
                                                parsed.error().what()});
        }
        request.pdf = std::move(*parsed);
    }
    return request;
}

} // anonymous namespace

auto status_for_error(ErrorCode code) -> http::status {
    switch (code) {
        case ErrorCode::ComplianceRejected: return http::status::unprocessable_entity;
        case ErrorCode::PoolExhausted:
        case ErrorCode::PoolShutdown: return http::status::service_unavailable;
        case ErrorCode::PageLoadTimeout: return http::status::gateway_timeout;
        case ErrorCode::InvalidArgument: return http::status::bad_request;
        default: return http::status::internal_server_error;
    }
}

auto json_error(http::status status, std::string_view code, std::string_view message)
    -> ApiResponse {
    ApiResponse response;
    response.status = status;
    response.body = json{
        {"success", false},
        {"error", {{"code", std::string(code)}, {"message", std::string(message)}}},
    }.dump();
    return response;
}

auto error_response(const RequestError& error) -> ApiResponse {
    return json_error(error.status, error.code, error.message);
}

auto wants_json(std::string_view accept) -> bool {
    return utils::to_lower(accept).find("application/json") != std::string::npos;
}

auto parse_render_body(std::string_view body, render::RenderKind kind)
    -> Parsed<render::RenderRequest> {
    auto parsed = parse_json(body);
    if (!parsed) return std::unexpected(parsed.error());
    return build_request(*parsed, kind);
}

auto parse_batch_body(std::string_view body) -> Parsed<std::vector<render::RenderRequest>> {
    auto parsed = parse_json(body);
    if (!parsed) return std::unexpected(parsed.error());

    const auto& doc = *parsed;
    if (!doc.contains("requests") || !doc["requests"].is_array() || doc["requests"].empty()) {
        return std::unexpected(RequestError{http::status::bad_request, "MISSING_REQUESTS",
                                            "requests must be a non-empty array"});
    }

    std::vector<render::RenderRequest> requests;
    requests.reserve(doc["requests"].size());
    for (const auto& item : doc["requests"]) {
        auto request = build_request(item, render::RenderKind::Screenshot);
        if (!request) return std::unexpected(request.error());
        requests.push_back(std::move(*request));
    }
    return requests;
}

auto render_response(const render::RenderResult& result, bool as_json,
                     std::optional<std::string> attachment_name) -> ApiResponse {
    if (!result.success) {
        return json_error(status_for_error(result.error_kind),
                          error_code_to_string(result.error_kind), result.message);
    }

    ApiResponse response;
    if (as_json) {
        response.body = render::to_json(result).dump();
        return response;
    }

    response.content_type = result.content_type();
    response.body = result.artifact;
    response.headers.emplace_back("X-Render-Time", std::to_string(result.render_duration_ms));
    if (attachment_name) {
        response.headers.emplace_back("Content-Disposition",
            "attachment; filename=\"" + *attachment_name + "\"");
    }
    return response;
}

Router::Router(render::RenderingService& renderer, render::BatchCoordinator& batch,
               const render::HealthReporter& health)
    : renderer_(renderer), batch_(batch), health_(health) {}

auto Router::handle(const http::request<http::string_body>& request) -> awaitable<ApiResponse> {
    auto target = std::string_view(request.target());
    if (auto query = target.find('?'); query != std::string_view::npos) {
        target = target.substr(0, query);
    }
    auto method = request.method();

    if (target == "/health" && method == http::verb::get) {
        ApiResponse response;
        response.body = render::to_json(health_.report()).dump();
        co_return response;
    }
    if (method == http::verb::post) {
        if (target == "/render/screenshot") {
            co_return co_await render_single(request, render::RenderKind::Screenshot, false);
        }
        if (target == "/render/pdf") {
            co_return co_await render_single(request, render::RenderKind::Pdf, false);
        }
        if (target == "/render/slide-pdf") {
            co_return co_await render_single(request, render::RenderKind::Pdf, true);
        }
        if (target == "/render/screenshot/batch") {
            co_return co_await render_batch(request);
        }
    }

    std::string_view method_name = request.method_string();
    co_return json_error(http::status::not_found, "NOT_FOUND",
                         "No route for " + std::string(method_name) + " " + std::string(target));
}

auto Router::render_single(const http::request<http::string_body>& request,
                           render::RenderKind kind, bool slide) -> awaitable<ApiResponse> {
    auto parsed = parse_render_body(request.body(), kind);
    if (!parsed) co_return error_response(parsed.error());

    auto as_json = wants_json(request[http::field::accept]);

    if (slide) {
        auto result = co_await renderer_.slide_pdf(std::move(parsed->html));
        co_return render_response(result, as_json, std::string("slide.pdf"));
    }

    auto result = co_await renderer_.render(*parsed);
    std::optional<std::string> attachment;
    if (kind == render::RenderKind::Pdf) attachment = "document.pdf";
    co_return render_response(result, as_json, attachment);
}

auto Router::render_batch(const http::request<http::string_body>& request)
    -> awaitable<ApiResponse> {
    auto parsed = parse_batch_body(request.body());
    if (!parsed) co_return error_response(parsed.error());

    auto results = co_await batch_.render_batch(std::move(*parsed));

    json items = json::array();
    for (const auto& result : results) {
        items.push_back(render::to_json(result));
    }

    ApiResponse response;
    response.body = json{{"success", true}, {"results", std::move(items)}}.dump();
    co_return response;
}

} // namespace prism::server

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "prism/core/error.hpp"

namespace prism::render {

using json = nlohmann::json;

enum class RenderKind {
    Screenshot,
    Pdf,
};

auto render_kind_to_string(RenderKind kind) -> std::string_view;

/// Screenshot options as requested. Unset fields take configured defaults.
struct ScreenshotOptions {
    std::optional<std::string> format;        // "png" | "jpeg"
    std::optional<int> quality;               // jpeg only, 0-100
    std::optional<bool> full_page;            // defaults to true
    std::optional<int> viewport_width;
    std::optional<int> viewport_height;
    std::optional<bool> omit_background;
};

struct PdfMarginOptions {
    std::optional<std::string> top;
    std::optional<std::string> right;
    std::optional<std::string> bottom;
    std::optional<std::string> left;
};

struct PdfOptions {
    std::optional<std::string> format;        // "A4" | "Letter" | "Legal"
    std::optional<std::string> width;
    std::optional<std::string> height;
    std::optional<bool> print_background;     // defaults to true
    PdfMarginOptions margin;
};

struct RenderRequest {
    std::string html;
    RenderKind kind = RenderKind::Screenshot;
    ScreenshotOptions screenshot;
    PdfOptions pdf;
};

struct RenderResult {
    bool success = false;

    // Success fields.
    std::string artifact;                     // raw image or PDF bytes
    std::string format;                       // "png", "jpeg" or "pdf"
    int width = 0;
    int height = 0;
    int64_t render_duration_ms = 0;
    double compliance_score = 0.0;

    // Failure fields.
    ErrorCode error_kind = ErrorCode::Unknown;
    std::string message;
    std::vector<std::string> details;

    static auto failure(ErrorCode kind, std::string message,
                        std::vector<std::string> details = {}) -> RenderResult;
    static auto failure(const Error& error) -> RenderResult;

    /// MIME type of the artifact.
    [[nodiscard]] auto content_type() const -> std::string;
};

/// `{success, data:{base64, format, width, height, renderTime, complianceScore}}`
/// or `{success:false, error:{code, message, details}}`.
auto to_json(const RenderResult& result) -> json;

/// Parses the camelCase `options` object of a screenshot request.
/// Null or absent options yield all defaults.
auto parse_screenshot_options(const json& options) -> Result<ScreenshotOptions>;

/// Parses the camelCase `options` object of a PDF request.
auto parse_pdf_options(const json& options) -> Result<PdfOptions>;

} // namespace prism::render

#include "prism/render/types.hpp"
#include "prism/core/utils.hpp"

namespace prism::render {

namespace {

auto invalid(std::string field, std::string why) -> Error {
    return make_error(ErrorCode::InvalidArgument,
                      "Invalid option '" + field + "'", std::move(why));
}

auto read_string(const json& obj, const char* key, std::optional<std::string>& out)
    -> Result<void> {
    if (!obj.contains(key) || obj[key].is_null()) return {};
    if (!obj[key].is_string()) return std::unexpected(invalid(key, "expected a string"));
    out = obj[key].get<std::string>();
    return {};
}

auto read_bool(const json& obj, const char* key, std::optional<bool>& out) -> Result<void> {
    if (!obj.contains(key) || obj[key].is_null()) return {};
    if (!obj[key].is_boolean()) return std::unexpected(invalid(key, "expected a boolean"));
    out = obj[key].get<bool>();
    return {};
}

auto read_int(const json& obj, const char* key, int min, int max, std::optional<int>& out)
    -> Result<void> {
    if (!obj.contains(key) || obj[key].is_null()) return {};
    const auto& value = obj[key];
    if (!value.is_number()) return std::unexpected(invalid(key, "expected a number"));
    auto number = value.get<double>();
    if (number < min || number > max) {
        return std::unexpected(invalid(key,
            "must be between " + std::to_string(min) + " and " + std::to_string(max)));
    }
    out = static_cast<int>(number);
    return {};
}

} // anonymous namespace

auto render_kind_to_string(RenderKind kind) -> std::string_view {
    switch (kind) {
        case RenderKind::Screenshot: return "screenshot";
        case RenderKind::Pdf: return "pdf";
    }
    return "screenshot";
}

auto RenderResult::failure(ErrorCode kind, std::string message,
                           std::vector<std::string> details) -> RenderResult {
    RenderResult result;
    result.success = false;
    result.error_kind = kind;
    result.message = std::move(message);
    result.details = std::move(details);
    return result;
}

auto RenderResult::failure(const Error& error) -> RenderResult {
    std::vector<std::string> details;
    if (!error.detail().empty()) {
        details.emplace_back(error.detail());
    }
    return failure(error.code(), std::string(error.message()), std::move(details));
}

auto RenderResult::content_type() const -> std::string {
    if (format == "pdf") return "application/pdf";
    if (format == "jpeg") return "image/jpeg";
    return "image/png";
}

auto to_json(const RenderResult& result) -> json {
    if (!result.success) {
        json error = {
            {"code", std::string(error_code_to_string(result.error_kind))},
            {"message", result.message},
        };
        if (!result.details.empty()) {
            error["details"] = result.details;
        }
        return {{"success", false}, {"error", std::move(error)}};
    }

    json data = {
        {"base64", utils::base64_encode(result.artifact)},
        {"format", result.format},
        {"renderTime", result.render_duration_ms},
        {"complianceScore", result.compliance_score},
    };
    if (result.width > 0) data["width"] = result.width;
    if (result.height > 0) data["height"] = result.height;
    return {{"success", true}, {"data", std::move(data)}};
}

auto parse_screenshot_options(const json& options) -> Result<ScreenshotOptions> {
    ScreenshotOptions parsed;
    if (options.is_null()) return parsed;
    if (!options.is_object()) {
        return std::unexpected(invalid("options", "expected an object"));
    }

    if (auto r = read_string(options, "format", parsed.format); !r) {
        return std::unexpected(r.error());
    }
    if (parsed.format) {
        auto format = utils::to_lower(*parsed.format);
        if (format == "jpg") format = "jpeg";
        if (format != "png" && format != "jpeg") {
            return std::unexpected(invalid("format", "expected png or jpeg"));
        }
        parsed.format = format;
    }

    if (auto r = read_int(options, "quality", 0, 100, parsed.quality); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_bool(options, "fullPage", parsed.full_page); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_int(options, "viewportWidth", 1, 16384, parsed.viewport_width); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_int(options, "viewportHeight", 1, 16384, parsed.viewport_height); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_bool(options, "omitBackground", parsed.omit_background); !r) {
        return std::unexpected(r.error());
    }
    return parsed;
}

auto parse_pdf_options(const json& options) -> Result<PdfOptions> {
    PdfOptions parsed;
    if (options.is_null()) return parsed;
    if (!options.is_object()) {
        return std::unexpected(invalid("options", "expected an object"));
    }

    if (auto r = read_string(options, "format", parsed.format); !r) {
        return std::unexpected(r.error());
    }
    if (parsed.format) {
        auto format = utils::to_lower(*parsed.format);
        if (format == "a4") parsed.format = "A4";
        else if (format == "letter") parsed.format = "Letter";
        else if (format == "legal") parsed.format = "Legal";
        else return std::unexpected(invalid("format", "expected A4, Letter or Legal"));
    }

    if (auto r = read_string(options, "width", parsed.width); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_string(options, "height", parsed.height); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_bool(options, "printBackground", parsed.print_background); !r) {
        return std::unexpected(r.error());
    }

    if (options.contains("margin") && !options["margin"].is_null()) {
        const auto& margin = options["margin"];
        if (!margin.is_object()) {
            return std::unexpected(invalid("margin", "expected an object"));
        }
        for (auto [key, slot] : {
                 std::pair{"top", &parsed.margin.top},
                 std::pair{"right", &parsed.margin.right},
                 std::pair{"bottom", &parsed.margin.bottom},
                 std::pair{"left", &parsed.margin.left},
             }) {
            if (auto r = read_string(margin, key, *slot); !r) {
                return std::unexpected(r.error());
            }
        }
    }
    return parsed;
}

} // namespace prism::render

#include "prism/browser/page_params.hpp"
#include "prism/core/utils.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace prism::browser {

namespace {

constexpr double kPixelsPerInch = 96.0;
constexpr double kCentimetersPerInch = 2.54;

} // anonymous namespace

auto css_length_to_inches(std::string_view length) -> Result<double> {
    auto text = utils::to_lower(utils::trim(length));
    if (text.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Empty CSS length"));
    }

    double divisor = kPixelsPerInch;
    std::string_view number = text;
    if (text.ends_with("px")) {
        number.remove_suffix(2);
    } else if (text.ends_with("in")) {
        number.remove_suffix(2);
        divisor = 1.0;
    } else if (text.ends_with("cm")) {
        number.remove_suffix(2);
        divisor = kCentimetersPerInch;
    } else if (text.ends_with("mm")) {
        number.remove_suffix(2);
        divisor = kCentimetersPerInch * 10.0;
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc{} || ptr != number.data() + number.size() ||
        !std::isfinite(value) || value < 0.0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid CSS length", std::string(length)));
    }
    return value / divisor;
}

auto paper_size_inches(std::string_view format) -> Result<std::pair<double, double>> {
    auto name = utils::to_lower(utils::trim(format));
    if (name == "a4") return std::pair{8.27, 11.7};
    if (name == "letter") return std::pair{8.5, 11.0};
    if (name == "legal") return std::pair{8.5, 14.0};
    return std::unexpected(make_error(ErrorCode::InvalidArgument,
        "Unsupported paper format", std::string(format)));
}

auto build_screenshot_params(const ScreenshotSpec& spec,
                             const std::optional<json>& content_size) -> json {
    json params = {
        {"format", spec.format},
        {"captureBeyondViewport", spec.full_page},
        {"fromSurface", true},
    };

    // Chrome ignores quality for png and rejects it in some versions.
    if (spec.format == "jpeg" && spec.quality) {
        params["quality"] = *spec.quality;
    }

    if (spec.full_page && content_size) {
        params["clip"] = {
            {"x", 0},
            {"y", 0},
            {"width", std::ceil(content_size->value("width", 0.0))},
            {"height", std::ceil(content_size->value("height", 0.0))},
            {"scale", 1},
        };
    }
    return params;
}

auto build_pdf_params(const PdfSpec& spec) -> Result<json> {
    // Letter is Chrome's default paper.
    double width = 8.5;
    double height = 11.0;

    if (spec.paper_format) {
        auto size = paper_size_inches(*spec.paper_format);
        if (!size) return std::unexpected(size.error());
        width = size->first;
        height = size->second;
    }
    if (spec.width) {
        auto w = css_length_to_inches(*spec.width);
        if (!w) return std::unexpected(w.error());
        width = *w;
    }
    if (spec.height) {
        auto h = css_length_to_inches(*spec.height);
        if (!h) return std::unexpected(h.error());
        height = *h;
    }

    auto top = css_length_to_inches(spec.margins.top);
    if (!top) return std::unexpected(top.error());
    auto right = css_length_to_inches(spec.margins.right);
    if (!right) return std::unexpected(right.error());
    auto bottom = css_length_to_inches(spec.margins.bottom);
    if (!bottom) return std::unexpected(bottom.error());
    auto left = css_length_to_inches(spec.margins.left);
    if (!left) return std::unexpected(left.error());

    return json{
        {"printBackground", spec.print_background},
        {"preferCSSPageSize", spec.prefer_css_page_size},
        {"paperWidth", width},
        {"paperHeight", height},
        {"marginTop", *top},
        {"marginRight", *right},
        {"marginBottom", *bottom},
        {"marginLeft", *left},
        {"transferMode", "ReturnAsBase64"},
    };
}

} // namespace prism::browser

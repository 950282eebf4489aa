#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "prism/browser/browser.hpp"
#include "prism/core/error.hpp"

namespace prism::browser {

using json = nlohmann::json;

/// Converts a CSS length ("1280px", "8.5in", "2cm", "10mm", "0") to inches.
/// Bare numbers are pixels, as in Chrome's print settings.
auto css_length_to_inches(std::string_view length) -> Result<double>;

/// Paper dimensions (width, height) in inches for a named format.
auto paper_size_inches(std::string_view format) -> Result<std::pair<double, double>>;

/// Parameters for Page.captureScreenshot. `content_size` is the
/// cssContentSize from Page.getLayoutMetrics, required for full-page capture.
auto build_screenshot_params(const ScreenshotSpec& spec,
                             const std::optional<json>& content_size = std::nullopt)
    -> json;

/// Parameters for Page.printToPDF.
auto build_pdf_params(const PdfSpec& spec) -> Result<json>;

} // namespace prism::browser

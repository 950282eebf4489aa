#pragma once

#include <string>

#include <boost/asio/awaitable.hpp>

#include "prism/browser/browser.hpp"
#include "prism/browser/browser_pool.hpp"
#include "prism/core/config.hpp"
#include "prism/render/compliance.hpp"
#include "prism/render/types.hpp"

namespace prism::render {

using boost::asio::awaitable;

/// Screenshot options with configured defaults filled in.
struct ResolvedScreenshot {
    browser::Viewport viewport;
    browser::ScreenshotSpec spec;
    bool omit_background = false;
};

auto resolve_screenshot(const ScreenshotOptions& options, const RenderConfig& config)
    -> ResolvedScreenshot;

auto resolve_pdf(const PdfOptions& options, const RenderConfig& config) -> browser::PdfSpec;

/// Slide preset: SLIDE_WIDTH x SLIDE_HEIGHT, zero margins, backgrounds printed.
auto slide_pdf_options(const RenderConfig& config) -> PdfOptions;

/// Turns markup into a screenshot or PDF using one pooled browser per call.
///
/// Each render runs: compliance gate, lease, new page, viewport, load,
/// font readiness, capture, page close, lease release. The page is closed
/// and the lease released on every path, including failures and
/// exceptions thrown by the browser layer. Failures come back as a
/// RenderResult with success == false; render() itself does not throw.
class RenderingService {
public:
    RenderingService(browser::BrowserPool& pool, RenderConfig config,
                     ComplianceGate gate = {});

    auto render(const RenderRequest& request) -> awaitable<RenderResult>;

    auto screenshot(std::string html, ScreenshotOptions options = {}) -> awaitable<RenderResult>;
    auto pdf(std::string html, PdfOptions options = {}) -> awaitable<RenderResult>;
    auto slide_pdf(std::string html) -> awaitable<RenderResult>;

    [[nodiscard]] auto config() const -> const RenderConfig& { return config_; }

private:
    auto render_with_lease(const RenderRequest& request) -> awaitable<RenderResult>;
    auto drive_page(browser::Page& page, const RenderRequest& request) -> awaitable<RenderResult>;

    browser::BrowserPool& pool_;
    RenderConfig config_;
    ComplianceGate gate_;
};

} // namespace prism::render

#include "prism/render/rendering_service.hpp"
#include "prism/browser/page_params.hpp"
#include "prism/core/logger.hpp"
#include "prism/core/utils.hpp"

#include <chrono>

namespace prism::render {

using std::chrono::milliseconds;

namespace {

auto action_for(RenderKind kind) -> std::string {
    return kind == RenderKind::Pdf ? "pdf_generation" : "screenshot_generation";
}

auto load_failure(const Error& error) -> RenderResult {
    if (error.code() == ErrorCode::Timeout) {
        return RenderResult::failure(ErrorCode::PageLoadTimeout,
            "Page did not finish loading", {std::string(error.detail())});
    }
    return RenderResult::failure(error);
}

auto capture_failure(std::string_view what, const Error& error) -> RenderResult {
    return RenderResult::failure(ErrorCode::CaptureFailure,
        std::string(what) + " failed", {error.what()});
}

} // anonymous namespace

auto resolve_screenshot(const ScreenshotOptions& options, const RenderConfig& config)
    -> ResolvedScreenshot {
    ResolvedScreenshot resolved;
    resolved.viewport.width = options.viewport_width.value_or(config.default_viewport_width);
    resolved.viewport.height = options.viewport_height.value_or(config.default_viewport_height);
    resolved.viewport.device_scale_factor = config.device_scale_factor;

    resolved.spec.format = options.format.value_or("png");
    if (resolved.spec.format == "jpeg") {
        resolved.spec.quality = options.quality.value_or(config.screenshot_quality);
    }
    resolved.spec.full_page = options.full_page.value_or(true);
    resolved.omit_background = options.omit_background.value_or(false);
    return resolved;
}

auto resolve_pdf(const PdfOptions& options, const RenderConfig& config) -> browser::PdfSpec {
    browser::PdfSpec spec;
    spec.paper_format = options.format;
    spec.width = options.width;
    spec.height = options.height;
    spec.print_background = options.print_background.value_or(true);
    spec.margins.top = options.margin.top.value_or(config.pdf_margin_top);
    spec.margins.right = options.margin.right.value_or(config.pdf_margin_right);
    spec.margins.bottom = options.margin.bottom.value_or(config.pdf_margin_bottom);
    spec.margins.left = options.margin.left.value_or(config.pdf_margin_left);
    spec.prefer_css_page_size = true;
    return spec;
}

auto slide_pdf_options(const RenderConfig& config) -> PdfOptions {
    PdfOptions options;
    options.width = config.slide_width;
    options.height = config.slide_height;
    options.print_background = true;
    options.margin.top = "0";
    options.margin.right = "0";
    options.margin.bottom = "0";
    options.margin.left = "0";
    return options;
}

RenderingService::RenderingService(browser::BrowserPool& pool, RenderConfig config,
                                   ComplianceGate gate)
    : pool_(pool), config_(std::move(config)), gate_(std::move(gate)) {
    if (!gate_) {
        gate_ = default_compliance_gate(config_.compliance_min_score);
    }
}

auto RenderingService::screenshot(std::string html, ScreenshotOptions options)
    -> awaitable<RenderResult> {
    RenderRequest request;
    request.html = std::move(html);
    request.kind = RenderKind::Screenshot;
    request.screenshot = std::move(options);
    co_return co_await render(request);
}

auto RenderingService::pdf(std::string html, PdfOptions options) -> awaitable<RenderResult> {
    RenderRequest request;
    request.html = std::move(html);
    request.kind = RenderKind::Pdf;
    request.pdf = std::move(options);
    co_return co_await render(request);
}

auto RenderingService::slide_pdf(std::string html) -> awaitable<RenderResult> {
    co_return co_await pdf(std::move(html), slide_pdf_options(config_));
}

auto RenderingService::render(const RenderRequest& request) -> awaitable<RenderResult> {
    auto started = std::chrono::steady_clock::now();
    auto kind = render_kind_to_string(request.kind);

    // Rejected requests never touch the pool.
    auto compliance = gate_(ComplianceInput{action_for(request.kind), request.html});
    if (!compliance.compliant) {
        auto rejected = RenderResult::failure(ErrorCode::ComplianceRejected,
            "Compliance check failed", compliance.violations);
        rejected.compliance_score = compliance.score;
        co_return rejected;
    }

    // Bad page geometry is a caller error; catch it before taking a browser.
    if (request.kind == RenderKind::Pdf) {
        auto params = browser::build_pdf_params(resolve_pdf(request.pdf, config_));
        if (!params) {
            auto invalid = RenderResult::failure(params.error());
            invalid.compliance_score = compliance.score;
            co_return invalid;
        }
    }

    RenderResult result;
    try {
        result = co_await render_with_lease(request);
    } catch (const std::exception& e) {
        result = RenderResult::failure(ErrorCode::InternalError,
            "Render failed unexpectedly", {e.what()});
    }

    result.compliance_score = compliance.score;
    result.render_duration_ms = utils::elapsed_ms(started);
    if (result.success) {
        LOG_INFO("Rendered {} ({} bytes, {}ms)", kind, result.artifact.size(),
                 result.render_duration_ms);
    } else {
        LOG_ERROR("{} render failed: [{}] {}", kind,
                  error_code_to_string(result.error_kind), result.message);
    }
    co_return result;
}

auto RenderingService::render_with_lease(const RenderRequest& request)
    -> awaitable<RenderResult> {
    auto lease = co_await pool_.acquire();
    if (!lease) {
        co_return RenderResult::failure(lease.error());
    }

    // From here on the lease destructor guarantees release, even on throw.
    auto page = co_await lease->browser().new_page();
    if (!page) {
        co_return RenderResult::failure(page.error());
    }

    RenderResult result;
    try {
        result = co_await drive_page(**page, request);
    } catch (const std::exception& e) {
        result = RenderResult::failure(ErrorCode::CaptureFailure,
            "Render aborted", {e.what()});
    }

    try {
        auto closed = co_await (*page)->close();
        if (!closed) {
            LOG_WARN("Failed to close page on {}: {}", lease->id(), closed.error().what());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Closing page on {} threw: {}", lease->id(), e.what());
    }

    lease->release();
    co_return result;
}

auto RenderingService::drive_page(browser::Page& page, const RenderRequest& request)
    -> awaitable<RenderResult> {
    auto load_timeout = milliseconds(config_.page_load_timeout_ms);
    auto capture_timeout = milliseconds(config_.capture_timeout_ms);

    browser::Viewport viewport;
    ResolvedScreenshot shot;
    browser::PdfSpec pdf_spec;
    if (request.kind == RenderKind::Screenshot) {
        shot = resolve_screenshot(request.screenshot, config_);
        viewport = shot.viewport;
    } else {
        pdf_spec = resolve_pdf(request.pdf, config_);
        viewport.width = config_.pdf_viewport_width;
        viewport.height = config_.pdf_viewport_height;
        viewport.device_scale_factor = config_.device_scale_factor;
    }

    auto configured = co_await page.set_viewport(viewport);
    if (!configured) co_return RenderResult::failure(configured.error());

    if (request.kind == RenderKind::Screenshot && shot.omit_background) {
        auto transparent = co_await page.set_transparent_background();
        if (!transparent) co_return RenderResult::failure(transparent.error());
    }

    auto loaded = co_await page.set_content(request.html, load_timeout);
    if (!loaded) co_return load_failure(loaded.error());

    auto fonts = co_await page.wait_for_fonts(load_timeout);
    if (!fonts) {
        LOG_WARN("Font readiness check failed, capturing anyway: {}", fonts.error().what());
    }

    RenderResult result;
    if (request.kind == RenderKind::Screenshot) {
        auto image = co_await page.screenshot(shot.spec, capture_timeout);
        if (!image) co_return capture_failure("Screenshot capture", image.error());
        result.artifact = std::move(*image);
        result.format = shot.spec.format;
        result.width = viewport.width;
        result.height = viewport.height;
    } else {
        auto document = co_await page.print_pdf(pdf_spec, capture_timeout);
        if (!document) co_return capture_failure("PDF generation", document.error());
        result.artifact = std::move(*document);
        result.format = "pdf";
    }
    result.success = true;
    co_return result;
}

} // namespace prism::render

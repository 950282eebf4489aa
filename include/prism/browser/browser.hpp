#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "prism/core/error.hpp"

namespace prism::browser {

using boost::asio::awaitable;

struct Viewport {
    int width = 1920;
    int height = 1080;
    double device_scale_factor = 1.0;
};

/// Fully resolved screenshot parameters (no environment fallbacks left).
struct ScreenshotSpec {
    std::string format = "png";     // "png" or "jpeg"
    std::optional<int> quality;     // only sent for jpeg
    bool full_page = true;
};

struct PdfMargins {
    std::string top = "0";
    std::string right = "0";
    std::string bottom = "0";
    std::string left = "0";
};

/// Fully resolved PDF parameters. Explicit width/height win over paper_format.
struct PdfSpec {
    std::optional<std::string> paper_format;   // "A4", "Letter", "Legal"
    std::optional<std::string> width;          // CSS length, e.g. "1280px"
    std::optional<std::string> height;
    bool print_background = true;
    PdfMargins margins;
    bool prefer_css_page_size = true;
};

/// One browser tab scoped to a single render. Every operation may fail with
/// an Error; none of them is expected to throw.
class Page {
public:
    virtual ~Page() = default;

    virtual auto set_viewport(const Viewport& viewport) -> awaitable<Result<void>> = 0;

    /// Makes the default page background transparent (omitBackground).
    virtual auto set_transparent_background() -> awaitable<Result<void>> = 0;

    /// Replaces the document with `html` and waits until it has loaded.
    /// Fails with ErrorCode::PageLoadTimeout when `timeout` expires first.
    virtual auto set_content(std::string_view html, std::chrono::milliseconds timeout)
        -> awaitable<Result<void>> = 0;

    /// Waits for document.fonts.ready.
    virtual auto wait_for_fonts(std::chrono::milliseconds timeout)
        -> awaitable<Result<void>> = 0;

    /// Returns raw image bytes.
    virtual auto screenshot(const ScreenshotSpec& spec, std::chrono::milliseconds timeout)
        -> awaitable<Result<std::string>> = 0;

    /// Returns raw PDF bytes.
    virtual auto print_pdf(const PdfSpec& spec, std::chrono::milliseconds timeout)
        -> awaitable<Result<std::string>> = 0;

    /// Closes the tab. Safe to call more than once.
    virtual auto close() -> awaitable<Result<void>> = 0;
};

/// Handle to one running browser process. Owned by the pool.
class BrowserProcess {
public:
    virtual ~BrowserProcess() = default;

    /// False once the process exited or its DevTools connection dropped.
    [[nodiscard]] virtual auto is_alive() const -> bool = 0;

    virtual auto new_page() -> awaitable<Result<std::unique_ptr<Page>>> = 0;

    /// Closes every tab other than about:blank. Returns how many were closed.
    virtual auto close_stray_pages() -> awaitable<Result<size_t>> = 0;

    /// Terminates the process. Safe to call more than once.
    virtual auto close() -> awaitable<void> = 0;
};

/// Creates browser processes for the pool.
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    /// Fails with ErrorCode::LaunchFailure when no process could be started.
    virtual auto launch() -> awaitable<Result<std::unique_ptr<BrowserProcess>>> = 0;
};

} // namespace prism::browser

#include "prism/browser/chrome_launcher.hpp"
#include "prism/browser/cdp_client.hpp"
#include "prism/browser/page_params.hpp"
#include "prism/core/logger.hpp"
#include "prism/core/utils.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <optional>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace prism::browser {

namespace fs = std::filesystem;
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kStartupPollInterval = std::chrono::milliseconds(100);
constexpr auto kGracefulExitWait = std::chrono::seconds(3);
constexpr auto kBrowserCloseTimeout = std::chrono::seconds(2);

// Everything is loaded once the document and its images are complete.
constexpr const char* kLoadedExpression =
    "document.readyState === 'complete' && "
    "Array.from(document.images).every(img => img.complete)";

auto sleep_for(std::chrono::milliseconds duration) -> awaitable<void> {
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(duration);
    co_await timer.async_wait(net::use_awaitable);
}

/// Time left until `deadline`, at least 1ms so it never means "default".
auto remaining(Clock::time_point deadline) -> std::chrono::milliseconds {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

/// Reads "<port>\n<path>" written by Chrome into the user data dir.
auto read_devtools_endpoint(const fs::path& port_file) -> std::optional<std::string> {
    std::ifstream file(port_file);
    if (!file.is_open()) return std::nullopt;

    std::string port;
    std::string path;
    if (!std::getline(file, port) || !std::getline(file, path)) {
        return std::nullopt;
    }
    port = utils::trim(port);
    path = utils::trim(path);
    if (port.empty() || path.empty()) return std::nullopt;
    return "ws://127.0.0.1:" + port + path;
}

void kill_and_reap(pid_t pid) {
    if (pid <= 0) return;
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

void remove_user_data_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG_WARN("Failed to remove {}: {}", dir.string(), ec.message());
    }
}

// ---------------------------------------------------------------------------
// CdpPage
// ---------------------------------------------------------------------------

class CdpPage : public Page {
public:
    CdpPage(std::shared_ptr<CdpClient> cdp, std::string target_id, std::string session_id)
        : cdp_(std::move(cdp)),
          target_id_(std::move(target_id)),
          session_id_(std::move(session_id)) {}

    auto set_viewport(const Viewport& viewport) -> awaitable<Result<void>> override {
        auto result = co_await cdp_->send_command("Emulation.setDeviceMetricsOverride", {
            {"width", viewport.width},
            {"height", viewport.height},
            {"deviceScaleFactor", viewport.device_scale_factor},
            {"mobile", false},
        }, session_id_);
        if (!result) co_return make_fail(result.error());
        co_return ok_result();
    }

    auto set_transparent_background() -> awaitable<Result<void>> override {
        auto result = co_await cdp_->send_command("Emulation.setDefaultBackgroundColorOverride", {
            {"color", {{"r", 0}, {"g", 0}, {"b", 0}, {"a", 0}}},
        }, session_id_);
        if (!result) co_return make_fail(result.error());
        co_return ok_result();
    }

    auto set_content(std::string_view html, std::chrono::milliseconds timeout)
        -> awaitable<Result<void>> override {
        auto deadline = Clock::now() + timeout;

        auto tree = co_await cdp_->send_command("Page.getFrameTree", json::object(),
                                                session_id_, remaining(deadline));
        if (!tree) co_return make_fail(as_load_error(tree.error(), timeout));

        auto frame_id = tree->value(json::json_pointer("/frameTree/frame/id"), std::string());
        if (frame_id.empty()) {
            co_return make_fail(make_error(ErrorCode::ProtocolError,
                "Page.getFrameTree returned no main frame"));
        }

        auto set = co_await cdp_->send_command("Page.setDocumentContent", {
            {"frameId", frame_id},
            {"html", std::string(html)},
        }, session_id_, remaining(deadline));
        if (!set) co_return make_fail(as_load_error(set.error(), timeout));

        while (Clock::now() < deadline) {
            auto loaded = co_await evaluate(kLoadedExpression, false, remaining(deadline));
            if (!loaded && loaded.error().code() != ErrorCode::Timeout) {
                co_return make_fail(loaded.error());
            }
            if (loaded && loaded->is_boolean() && loaded->get<bool>()) {
                co_return ok_result();
            }
            co_await sleep_for(kPollInterval);
        }

        co_return make_fail(make_error(ErrorCode::PageLoadTimeout,
            "Page did not finish loading",
            std::to_string(timeout.count()) + "ms"));
    }

    auto wait_for_fonts(std::chrono::milliseconds timeout) -> awaitable<Result<void>> override {
        auto ready = co_await evaluate("document.fonts.ready.then(() => true)", true, timeout);
        if (!ready) co_return make_fail(ready.error());
        co_return ok_result();
    }

    auto screenshot(const ScreenshotSpec& spec, std::chrono::milliseconds timeout)
        -> awaitable<Result<std::string>> override {
        auto deadline = Clock::now() + timeout;

        std::optional<json> content_size;
        if (spec.full_page) {
            auto metrics = co_await cdp_->send_command("Page.getLayoutMetrics",
                json::object(), session_id_, remaining(deadline));
            if (!metrics) co_return make_fail(metrics.error());
            if (metrics->contains("cssContentSize")) {
                content_size = (*metrics)["cssContentSize"];
            }
        }

        auto shot = co_await cdp_->send_command("Page.captureScreenshot",
            build_screenshot_params(spec, content_size), session_id_, remaining(deadline));
        if (!shot) co_return make_fail(shot.error());
        co_return decode_data(*shot, "Page.captureScreenshot");
    }

    auto print_pdf(const PdfSpec& spec, std::chrono::milliseconds timeout)
        -> awaitable<Result<std::string>> override {
        auto params = build_pdf_params(spec);
        if (!params) co_return make_fail(params.error());

        auto pdf = co_await cdp_->send_command("Page.printToPDF", std::move(*params),
                                               session_id_, timeout);
        if (!pdf) co_return make_fail(pdf.error());
        co_return decode_data(*pdf, "Page.printToPDF");
    }

    auto close() -> awaitable<Result<void>> override {
        if (closed_) co_return ok_result();
        closed_ = true;

        auto result = co_await cdp_->send_command("Target.closeTarget", {
            {"targetId", target_id_},
        });
        if (!result) co_return make_fail(result.error());
        co_return ok_result();
    }

private:
    auto evaluate(std::string_view expression, bool await_promise,
                  std::chrono::milliseconds timeout) -> awaitable<Result<json>> {
        auto result = co_await cdp_->send_command("Runtime.evaluate", {
            {"expression", std::string(expression)},
            {"returnByValue", true},
            {"awaitPromise", await_promise},
        }, session_id_, timeout);
        if (!result) co_return make_fail(result.error());

        if (result->contains("exceptionDetails")) {
            co_return make_fail(make_error(ErrorCode::ProtocolError,
                "Script evaluation failed",
                (*result)["exceptionDetails"].value("text", "")));
        }
        co_return result->value(json::json_pointer("/result/value"), json());
    }

    static auto as_load_error(const Error& error, std::chrono::milliseconds timeout) -> Error {
        if (error.code() == ErrorCode::Timeout) {
            return make_error(ErrorCode::PageLoadTimeout, "Page did not finish loading",
                              std::to_string(timeout.count()) + "ms");
        }
        return error;
    }

    static auto decode_data(const json& result, std::string_view method) -> Result<std::string> {
        auto data = result.value("data", "");
        if (data.empty()) {
            return std::unexpected(make_error(ErrorCode::CaptureFailure,
                "Empty capture result", std::string(method)));
        }
        return utils::base64_decode(data);
    }

    std::shared_ptr<CdpClient> cdp_;
    std::string target_id_;
    std::string session_id_;
    bool closed_ = false;
};

// ---------------------------------------------------------------------------
// ChromeProcess
// ---------------------------------------------------------------------------

class ChromeProcess : public BrowserProcess {
public:
    ChromeProcess(std::string id, pid_t pid, fs::path user_data_dir,
                  std::shared_ptr<CdpClient> cdp)
        : id_(std::move(id)),
          pid_(pid),
          user_data_dir_(std::move(user_data_dir)),
          cdp_(std::move(cdp)) {}

    // Last resort when the pool never closed us.
    ~ChromeProcess() override {
        if (closed_.exchange(true)) return;
        if (!reap(WNOHANG)) {
            LOG_WARN("Killing unclosed Chrome process (pid={}, id={})", pid_, id_);
            kill_and_reap(pid_);
        }
        remove_user_data_dir(user_data_dir_);
    }

    [[nodiscard]] auto is_alive() const -> bool override {
        return !closed_ && cdp_->is_connected() && !reap(WNOHANG);
    }

    auto new_page() -> awaitable<Result<std::unique_ptr<Page>>> override {
        auto target = co_await cdp_->send_command("Target.createTarget", {
            {"url", "about:blank"},
        });
        if (!target) co_return make_fail(target.error());
        auto target_id = target->value("targetId", "");
        {
            std::lock_guard lock(targets_mutex_);
            opened_targets_.insert(target_id);
        }

        auto attached = co_await cdp_->send_command("Target.attachToTarget", {
            {"targetId", target_id},
            {"flatten", true},
        });
        if (!attached) {
            auto closed = co_await cdp_->send_command("Target.closeTarget", {
                {"targetId", target_id},
            });
            if (!closed) {
                LOG_DEBUG("Failed to close unattached target {}: {}",
                          target_id, closed.error().what());
            }
            co_return make_fail(attached.error());
        }
        auto session_id = attached->value("sessionId", "");

        auto enabled = co_await cdp_->send_command("Page.enable", json::object(), session_id);
        if (!enabled) {
            LOG_WARN("Failed to enable Page domain: {}", enabled.error().what());
        }

        co_return std::unique_ptr<Page>(
            std::make_unique<CdpPage>(cdp_, std::move(target_id), std::move(session_id)));
    }

    auto close_stray_pages() -> awaitable<Result<size_t>> override {
        auto targets = co_await cdp_->send_command("Target.getTargets");
        if (!targets) co_return make_fail(targets.error());

        std::set<std::string> opened;
        {
            std::lock_guard lock(targets_mutex_);
            opened = opened_targets_;
        }
        auto stray = stray_page_targets(
            targets->value("targetInfos", json::array()), opened);

        // Ids that are not stray are already gone; failed closes stay listed
        // so the next release retries them.
        std::set<std::string> still_open;
        size_t closed = 0;
        for (const auto& target_id : stray) {
            auto result = co_await cdp_->send_command("Target.closeTarget", {
                {"targetId", target_id},
            });
            if (result) {
                ++closed;
            } else {
                still_open.insert(target_id);
                LOG_WARN("Failed to close stray page on {}: {}", id_, result.error().what());
            }
        }

        {
            std::lock_guard lock(targets_mutex_);
            for (const auto& target_id : opened) {
                if (!still_open.contains(target_id)) {
                    opened_targets_.erase(target_id);
                }
            }
        }
        co_return closed;
    }

    auto close() -> awaitable<void> override {
        if (closed_.exchange(true)) co_return;

        if (cdp_->is_connected()) {
            // Chrome drops the socket while answering, so an error is expected.
            auto bye = co_await cdp_->send_command("Browser.close", json::object(), {},
                std::chrono::duration_cast<std::chrono::milliseconds>(kBrowserCloseTimeout));
            if (!bye) {
                LOG_TRACE("Browser.close on {}: {}", id_, bye.error().what());
            }
            co_await cdp_->disconnect();
        }

        auto deadline = Clock::now() + kGracefulExitWait;
        if (!reap(WNOHANG)) {
            ::kill(pid_, SIGTERM);
        }
        while (!reap(WNOHANG) && Clock::now() < deadline) {
            co_await sleep_for(kPollInterval);
        }
        if (!reap(WNOHANG)) {
            LOG_WARN("Chrome (pid={}) ignored SIGTERM, sending SIGKILL", pid_);
            kill_and_reap(pid_);
            exited_ = true;
        }

        remove_user_data_dir(user_data_dir_);
        LOG_DEBUG("Chrome process closed (pid={}, id={})", pid_, id_);
    }

private:
    /// True once the child has been reaped.
    auto reap(int options) const -> bool {
        if (exited_) return true;
        int status = 0;
        auto rc = ::waitpid(pid_, &status, options);
        if (rc == pid_ || (rc < 0 && errno == ECHILD)) {
            exited_ = true;
        }
        return exited_;
    }

    std::string id_;
    pid_t pid_;
    fs::path user_data_dir_;
    std::shared_ptr<CdpClient> cdp_;
    std::mutex targets_mutex_;
    std::set<std::string> opened_targets_;   // from new_page(), until seen closed
    std::atomic<bool> closed_{false};
    mutable std::atomic<bool> exited_{false};
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

auto find_chrome(const BrowserConfig& config) -> std::string {
    if (config.chrome_path) {
        if (fs::exists(*config.chrome_path)) {
            return *config.chrome_path;
        }
        LOG_WARN("Configured Chrome path does not exist: {}", *config.chrome_path);
    }

    static const std::vector<std::string> paths = {
        "/usr/bin/google-chrome",
        "/usr/bin/google-chrome-stable",
        "/usr/bin/chromium",
        "/usr/bin/chromium-browser",
        "/snap/bin/chromium",
        "/opt/google/chrome/chrome",
    };
    for (const auto& p : paths) {
        if (fs::exists(p)) return p;
    }

    if (const auto* path_env = std::getenv("PATH")) {
        const std::vector<const char*> names = {
            "google-chrome", "chromium", "chromium-browser", "chrome"};
        for (const auto& dir : utils::split(path_env, ':')) {
            for (const auto* name : names) {
                auto full = fs::path(dir) / name;
                if (fs::exists(full)) return full.string();
            }
        }
    }
    return {};
}

auto stray_page_targets(const json& target_infos, const std::set<std::string>& opened)
    -> std::vector<std::string> {
    std::vector<std::string> stray;
    if (!target_infos.is_array()) return stray;
    for (const auto& info : target_infos) {
        if (info.value("type", "") != "page") continue;
        auto target_id = info.value("targetId", "");
        if (opened.contains(target_id)) {
            stray.push_back(std::move(target_id));
        }
    }
    return stray;
}

auto chrome_arguments(const BrowserConfig& config, const fs::path& user_data_dir)
    -> std::vector<std::string> {
    std::vector<std::string> args;
    if (config.headless) {
        args.emplace_back("--headless=new");
    }
    for (const char* flag : {
             "--no-sandbox",
             "--disable-setuid-sandbox",
             "--disable-dev-shm-usage",
             "--disable-accelerated-2d-canvas",
             "--disable-gpu",
             "--no-first-run",
             "--no-default-browser-check",
             "--no-zygote",
             "--disable-background-networking",
             "--disable-background-timer-throttling",
             "--disable-backgrounding-occluded-windows",
             "--disable-breakpad",
             "--disable-component-extensions-with-background-pages",
             "--disable-extensions",
             "--disable-features=TranslateUI",
             "--disable-ipc-flooding-protection",
             "--disable-renderer-backgrounding",
             "--force-color-profile=srgb",
             "--hide-scrollbars",
             "--metrics-recording-only",
             "--mute-audio",
             "--remote-debugging-port=0",
         }) {
        args.emplace_back(flag);
    }
    args.push_back("--user-data-dir=" + user_data_dir.string());
    for (const auto& extra : config.extra_args) {
        args.push_back(extra);
    }
    args.emplace_back("about:blank");
    return args;
}

// ---------------------------------------------------------------------------
// ChromeLauncher
// ---------------------------------------------------------------------------

struct ChromeLauncher::Impl {
    net::io_context& ioc;
    BrowserConfig config;

    Impl(net::io_context& ctx, BrowserConfig cfg)
        : ioc(ctx), config(std::move(cfg)) {}
};

ChromeLauncher::ChromeLauncher(boost::asio::io_context& ioc, BrowserConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

ChromeLauncher::~ChromeLauncher() = default;

auto ChromeLauncher::config() const -> const BrowserConfig& {
    return impl_->config;
}

auto ChromeLauncher::launch() -> awaitable<Result<std::unique_ptr<BrowserProcess>>> {
    const auto& config = impl_->config;

    auto chrome_path = find_chrome(config);
    if (chrome_path.empty()) {
        co_return make_fail(make_error(ErrorCode::LaunchFailure,
            "Chrome/Chromium not found",
            "Set CHROME_PATH or browser.chrome_path"));
    }

    auto instance_id = utils::generate_id(12);
    auto user_data_dir = fs::temp_directory_path() / ("prism-chrome-" + instance_id);
    std::error_code dir_ec;
    fs::create_directories(user_data_dir, dir_ec);
    if (dir_ec) {
        co_return make_fail(make_error(ErrorCode::LaunchFailure,
            "Failed to create Chrome user data dir", dir_ec.message()));
    }

    // argv is built before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> argv_storage{chrome_path};
    for (auto& arg : chrome_arguments(config, user_data_dir)) {
        argv_storage.push_back(std::move(arg));
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        remove_user_data_dir(user_data_dir);
        co_return make_fail(make_error(ErrorCode::LaunchFailure,
            "Failed to fork Chrome process", "errno=" + std::to_string(err)));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    auto abandon = [&](std::string message, std::string detail) {
        kill_and_reap(pid);
        remove_user_data_dir(user_data_dir);
        return make_fail(make_error(ErrorCode::LaunchFailure,
                                    std::move(message), std::move(detail)));
    };

    // Chrome writes the ephemeral DevTools port once it is listening.
    auto port_file = user_data_dir / "DevToolsActivePort";
    auto deadline = Clock::now() + std::chrono::milliseconds(config.launch_timeout_ms);
    std::optional<std::string> ws_url;
    while (Clock::now() < deadline) {
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            remove_user_data_dir(user_data_dir);
            co_return make_fail(make_error(ErrorCode::LaunchFailure,
                "Chrome exited during startup",
                chrome_path + " status=" + std::to_string(status)));
        }
        ws_url = read_devtools_endpoint(port_file);
        if (ws_url) break;
        co_await sleep_for(kStartupPollInterval);
    }

    if (!ws_url) {
        co_return abandon("Chrome did not expose a DevTools endpoint",
                          std::to_string(config.launch_timeout_ms) + "ms");
    }

    auto cdp = std::make_shared<CdpClient>(impl_->ioc);
    auto connected = co_await cdp->connect(*ws_url);
    if (!connected) {
        co_return abandon("Failed to connect to Chrome DevTools",
                          connected.error().what());
    }

    LOG_INFO("Chrome launched (pid={}, id={}, endpoint={})", pid, instance_id, *ws_url);
    co_return std::unique_ptr<BrowserProcess>(std::make_unique<ChromeProcess>(
        std::move(instance_id), pid, std::move(user_data_dir), std::move(cdp)));
}

} // namespace prism::browser

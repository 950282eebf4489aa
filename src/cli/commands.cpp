#include "prism/cli/commands.hpp"
#include "prism/core/logger.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "prism/browser/browser_pool.hpp"
#include "prism/browser/chrome_launcher.hpp"
#include "prism/render/batch_coordinator.hpp"
#include "prism/render/health.hpp"
#include "prism/render/rendering_service.hpp"
#include "prism/server/http_server.hpp"
#include "prism/server/routes.hpp"

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef PRISM_VERSION_STRING
#define PRISM_VERSION_STRING "0.1.0-dev"
#endif

namespace prism::cli {

namespace net = boost::asio;
using net::awaitable;
using json = nlohmann::json;

namespace {

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot open " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto write_file(const std::filesystem::path& path, const std::string& data) -> Result<void> {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot write " + path.string()));
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Short write to " + path.string()));
    }
    return {};
}

auto resolve_or_exit(const GlobalOptions& options) -> Config {
    auto config = resolve_config(options);
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().what() << "\n";
        throw CLI::RuntimeError(2);
    }
    return std::move(*config);
}

auto worker_count(const ServerConfig& server) -> size_t {
    if (server.threads > 0) return server.threads;
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

} // anonymous namespace

auto resolve_config(const GlobalOptions& options) -> Result<Config> {
    if (!options.env_file.empty() && std::filesystem::exists(options.env_file)) {
        load_env_file(options.env_file);
    }

    Config base = options.config_path.empty()
        ? default_config()
        : load_config(std::filesystem::path(options.config_path));

    auto config = load_config_from_env(std::move(base));
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("serve", "Start the HTTP render server");

    auto host = std::make_shared<std::string>();
    sub->add_option("--host", *host, "Bind address (overrides config)");

    auto port = std::make_shared<uint16_t>(0);
    sub->add_option("-p,--port", *port, "Listen port (overrides config)");

    auto threads = std::make_shared<size_t>(0);
    sub->add_option("-t,--threads", *threads, "I/O worker threads (overrides config)");

    sub->callback([&options, host, port, threads]() {
        auto config = resolve_or_exit(options);
        Logger::init("prism", config.log_level);

        if (!host->empty()) config.server.host = *host;
        if (*port != 0) config.server.port = *port;
        if (*threads != 0) config.server.threads = *threads;

        net::io_context ioc;

        auto launcher = std::make_shared<browser::ChromeLauncher>(ioc, config.browser);
        browser::BrowserPool pool(ioc, config.pool, launcher);
        render::RenderingService renderer(pool, config.render);
        render::BatchCoordinator batch(renderer, config.render.batch_concurrency);
        render::HealthReporter health(pool);
        server::Router router(renderer, batch, health);
        server::HttpServer server(ioc, config.server, router);

        if (auto listening = server.listen(); !listening) {
            LOG_FATAL("{}", listening.error().what());
            throw CLI::RuntimeError(1);
        }

        LOG_INFO("Pool bounds: min={} max={}, batch concurrency={}",
                 config.pool.min_instances, config.pool.max_instances,
                 batch.concurrency());

        net::co_spawn(ioc, [&pool]() -> awaitable<void> {
            auto launched = co_await pool.warm_up();
            LOG_INFO("Warm-up launched {} browser(s)", launched);
        }, net::detached);
        net::co_spawn(ioc, pool.run_eviction(), net::detached);
        net::co_spawn(ioc, server.run(), net::detached);

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](auto ec, int signal) {
            if (ec) return;
            LOG_INFO("Received signal {}, shutting down", signal);
            server.stop();
            net::co_spawn(ioc, [&]() -> awaitable<void> {
                co_await pool.shutdown();
                ioc.stop();
            }, net::detached);
        });

        auto count = worker_count(config.server);
        std::vector<std::thread> workers;
        workers.reserve(count - 1);
        for (size_t i = 1; i < count; ++i) {
            workers.emplace_back([&ioc]() { ioc.run(); });
        }
        LOG_INFO("Render server running with {} thread(s). Press Ctrl+C to stop.", count);
        ioc.run();
        for (auto& worker : workers) {
            worker.join();
        }

        LOG_INFO("Render server stopped.");
    });
}

// ---------------------------------------------------------------------------
// render command
// ---------------------------------------------------------------------------

namespace {

struct RenderCommandOptions {
    std::string input;
    std::string output;
    std::string type = "screenshot";
    std::string format;
    int width = 0;
    int height = 0;
    int quality = -1;
    bool no_full_page = false;
    bool omit_background = false;
    std::string paper;
};

auto build_request(const RenderCommandOptions& opts, std::string html,
                   const RenderConfig& render_config) -> render::RenderRequest {
    render::RenderRequest request;
    request.html = std::move(html);

    if (opts.type == "screenshot") {
        request.kind = render::RenderKind::Screenshot;
        auto& shot = request.screenshot;
        if (!opts.format.empty()) shot.format = opts.format == "jpg" ? "jpeg" : opts.format;
        if (opts.quality >= 0) shot.quality = opts.quality;
        if (opts.width > 0) shot.viewport_width = opts.width;
        if (opts.height > 0) shot.viewport_height = opts.height;
        if (opts.no_full_page) shot.full_page = false;
        if (opts.omit_background) shot.omit_background = true;
    } else if (opts.type == "slide") {
        request.kind = render::RenderKind::Pdf;
        request.pdf = render::slide_pdf_options(render_config);
    } else {
        request.kind = render::RenderKind::Pdf;
        if (!opts.paper.empty()) request.pdf.format = opts.paper;
    }
    return request;
}

} // anonymous namespace

void register_render_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("render", "Render an HTML file to an image or PDF");

    auto opts = std::make_shared<RenderCommandOptions>();
    sub->add_option("input", opts->input, "HTML file to render")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-o,--output", opts->output, "Output file")->required();
    sub->add_option("--type", opts->type, "Artifact type")
        ->check(CLI::IsMember({"screenshot", "pdf", "slide"}))
        ->capture_default_str();
    sub->add_option("-f,--format", opts->format, "Screenshot format")
        ->check(CLI::IsMember({"png", "jpeg", "jpg"}));
    sub->add_option("--width", opts->width, "Viewport width")->check(CLI::Range(1, 16384));
    sub->add_option("--height", opts->height, "Viewport height")->check(CLI::Range(1, 16384));
    sub->add_option("-q,--quality", opts->quality, "JPEG quality")->check(CLI::Range(0, 100));
    sub->add_option("--paper", opts->paper, "PDF paper format")
        ->check(CLI::IsMember({"A4", "Letter", "Legal"}, CLI::ignore_case));
    sub->add_flag("--no-full-page", opts->no_full_page, "Capture the viewport only");
    sub->add_flag("--omit-background", opts->omit_background, "Transparent PNG background");

    sub->callback([&options, opts]() {
        auto config = resolve_or_exit(options);
        Logger::init("prism", config.log_level);

        auto html = read_file(opts->input);
        if (!html) {
            std::cerr << html.error().what() << "\n";
            throw CLI::RuntimeError(1);
        }

        // One browser, launched on demand and closed before exit.
        config.pool.min_instances = 0;
        config.pool.max_instances = 1;

        net::io_context ioc;
        auto launcher = std::make_shared<browser::ChromeLauncher>(ioc, config.browser);
        browser::BrowserPool pool(ioc, config.pool, launcher);
        render::RenderingService renderer(pool, config.render);

        auto request = build_request(*opts, std::move(*html), config.render);
        std::optional<render::RenderResult> outcome;

        net::co_spawn(ioc, [&]() -> awaitable<void> {
            outcome = co_await renderer.render(request);
            co_await pool.shutdown();
        }, net::detached);
        ioc.run();

        if (!outcome || !outcome->success) {
            if (outcome) {
                std::cerr << "Render failed (" << error_code_to_string(outcome->error_kind)
                          << "): " << outcome->message << "\n";
                for (const auto& detail : outcome->details) {
                    std::cerr << "  - " << detail << "\n";
                }
            } else {
                std::cerr << "Render did not complete\n";
            }
            throw CLI::RuntimeError(1);
        }

        if (auto written = write_file(opts->output, outcome->artifact); !written) {
            std::cerr << written.error().what() << "\n";
            throw CLI::RuntimeError(1);
        }

        std::cout << "Wrote " << outcome->artifact.size() << " bytes (" << outcome->format
                  << ") to " << opts->output << " in " << outcome->render_duration_ms
                  << "ms\n";
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&options, validate_only]() {
        auto config = resolve_config(options);
        if (!config) {
            std::cerr << "Invalid configuration: " << config.error().what() << "\n";
            throw CLI::RuntimeError(2);
        }

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = *config;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "prism " << PRISM_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__linux__)
        std::cout << "Platform: Linux\n";
#else
        std::cout << "Platform: other\n";
#endif
    });
}

} // namespace prism::cli

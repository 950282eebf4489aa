#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "prism/core/error.hpp"

// std::optional serializer for nlohmann/json, so optional config fields
// round-trip as null.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace prism {

using json = nlohmann::json;

/// Bounds and eviction parameters of the browser pool. Durations in ms.
struct PoolConfig {
    size_t min_instances = 1;
    size_t max_instances = 5;
    int64_t max_age_ms = 3600000;         // 1 hour
    int64_t idle_timeout_ms = 300000;     // 5 minutes
    int64_t sweep_interval_ms = 60000;
    int64_t acquire_timeout_ms = 0;       // 0 = wait until an instance frees up
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PoolConfig, min_instances, max_instances,
    max_age_ms, idle_timeout_ms, sweep_interval_ms, acquire_timeout_ms)

/// How Chrome processes are started.
struct BrowserConfig {
    bool headless = true;
    std::optional<std::string> chrome_path;
    int launch_timeout_ms = 30000;
    std::vector<std::string> extra_args;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BrowserConfig, headless, chrome_path,
    launch_timeout_ms, extra_args)

/// Defaults applied to render requests that leave an option unset.
struct RenderConfig {
    int default_viewport_width = 1920;
    int default_viewport_height = 1080;
    int pdf_viewport_width = 1920;
    int pdf_viewport_height = 1080;
    double device_scale_factor = 1.0;
    int screenshot_quality = 90;
    int page_load_timeout_ms = 30000;
    int capture_timeout_ms = 30000;
    std::string pdf_margin_top = "0";
    std::string pdf_margin_right = "0";
    std::string pdf_margin_bottom = "0";
    std::string pdf_margin_left = "0";
    std::string slide_width = "1280px";
    std::string slide_height = "720px";
    size_t batch_concurrency = 3;
    double compliance_min_score = 0.997;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RenderConfig, default_viewport_width,
    default_viewport_height, pdf_viewport_width, pdf_viewport_height, device_scale_factor,
    screenshot_quality, page_load_timeout_ms, capture_timeout_ms, pdf_margin_top,
    pdf_margin_right, pdf_margin_bottom, pdf_margin_left, slide_width, slide_height,
    batch_concurrency, compliance_min_score)

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8081;
    size_t threads = 0;                       // 0 = hardware concurrency
    size_t max_body_bytes = 10 * 1024 * 1024;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, host, port, threads, max_body_bytes)

struct Config {
    PoolConfig pool;
    BrowserConfig browser;
    RenderConfig render;
    ServerConfig server;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, pool, browser, render, server, log_level)

auto default_config() -> Config;

/// Loads a JSON config file. Missing or malformed files yield defaults.
auto load_config(const std::filesystem::path& path) -> Config;

/// Overlays the BROWSER_*, PUPPETEER_*, render and server environment
/// variables onto `base`. Unparseable values are logged and ignored.
auto load_config_from_env(Config base = default_config()) -> Config;

/// Applies KEY=VALUE lines of a .env file to the process environment.
/// Existing variables win unless `overwrite` is set. Returns the number of
/// variables that were set.
auto load_env_file(const std::filesystem::path& path, bool overwrite = false) -> size_t;

/// Rejects configurations the pool and batch coordinator cannot honour.
auto validate_config(const Config& config) -> Result<void>;

} // namespace prism

#include "prism/core/config.hpp"
#include "prism/core/logger.hpp"
#include "prism/core/utils.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace prism {

namespace {

template <typename T>
void env_number(const char* name, T& target) {
    auto* val = std::getenv(name);
    if (!val || *val == '\0') return;

    std::string_view text(val);
    T parsed{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        LOG_WARN("Config: ignoring {}='{}' (not a number)", name, text);
        return;
    }
    target = parsed;
}

void env_string(const char* name, std::string& target) {
    if (auto* val = std::getenv(name); val && *val != '\0') {
        target = val;
    }
}

auto unquote(std::string_view value) -> std::string {
    if (value.size() >= 2 &&
        (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return std::string(value.substr(1, value.size() - 2));
    }
    // Unquoted values may carry an inline comment.
    auto comment = value.find(" #");
    if (comment != std::string_view::npos) {
        value = value.substr(0, comment);
    }
    return utils::trim(value);
}

} // anonymous namespace

auto default_config() -> Config {
    return Config{};
}

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env(Config base) -> Config {
    Config config = std::move(base);

    env_number("BROWSER_POOL_MIN", config.pool.min_instances);
    env_number("BROWSER_POOL_MAX", config.pool.max_instances);
    env_number("BROWSER_MAX_AGE", config.pool.max_age_ms);
    env_number("BROWSER_IDLE_TIMEOUT", config.pool.idle_timeout_ms);
    env_number("BROWSER_SWEEP_INTERVAL", config.pool.sweep_interval_ms);
    env_number("BROWSER_ACQUIRE_TIMEOUT", config.pool.acquire_timeout_ms);

    if (auto* val = std::getenv("PUPPETEER_HEADLESS")) {
        config.browser.headless = std::string_view(val) != "false";
    }
    env_number("PUPPETEER_TIMEOUT", config.browser.launch_timeout_ms);
    if (auto* val = std::getenv("CHROME_PATH"); val && *val != '\0') {
        config.browser.chrome_path = val;
    }

    env_number("DEFAULT_VIEWPORT_WIDTH", config.render.default_viewport_width);
    env_number("DEFAULT_VIEWPORT_HEIGHT", config.render.default_viewport_height);
    env_number("PDF_VIEWPORT_WIDTH", config.render.pdf_viewport_width);
    env_number("PDF_VIEWPORT_HEIGHT", config.render.pdf_viewport_height);
    env_number("DEVICE_SCALE_FACTOR", config.render.device_scale_factor);
    env_number("SCREENSHOT_QUALITY", config.render.screenshot_quality);
    env_number("PAGE_LOAD_TIMEOUT", config.render.page_load_timeout_ms);
    env_number("CAPTURE_TIMEOUT", config.render.capture_timeout_ms);
    env_string("PDF_MARGIN_TOP", config.render.pdf_margin_top);
    env_string("PDF_MARGIN_RIGHT", config.render.pdf_margin_right);
    env_string("PDF_MARGIN_BOTTOM", config.render.pdf_margin_bottom);
    env_string("PDF_MARGIN_LEFT", config.render.pdf_margin_left);
    env_string("SLIDE_WIDTH", config.render.slide_width);
    env_string("SLIDE_HEIGHT", config.render.slide_height);
    env_number("BATCH_CONCURRENCY", config.render.batch_concurrency);
    env_number("COMPLIANCE_MIN_SCORE", config.render.compliance_min_score);

    env_string("HOST", config.server.host);
    env_number("PORT", config.server.port);
    env_number("PRISM_THREADS", config.server.threads);
    env_string("PRISM_LOG_LEVEL", config.log_level);

    return config;
}

auto load_env_file(const std::filesystem::path& path, bool overwrite) -> size_t {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DEBUG("No .env file at {}", path.string());
        return 0;
    }

    size_t applied = 0;
    std::string raw_line;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        auto line = utils::trim(raw_line);
        if (line.empty() || line.front() == '#') continue;
        if (line.starts_with("export ")) {
            line = utils::trim(std::string_view(line).substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("{}:{}: skipping malformed line", path.string(), line_number);
            continue;
        }

        auto key = utils::trim(std::string_view(line).substr(0, eq));
        auto value = unquote(utils::trim(std::string_view(line).substr(eq + 1)));

        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
            LOG_WARN("Failed to set env var: {}", key);
            continue;
        }
        ++applied;
    }

    LOG_INFO("Loaded {} variables from {}", applied, path.string());
    return applied;
}

auto validate_config(const Config& config) -> Result<void> {
    const auto& pool = config.pool;
    if (pool.max_instances == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.max_instances must be at least 1"));
    }
    if (pool.min_instances > pool.max_instances) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.min_instances exceeds pool.max_instances",
            std::to_string(pool.min_instances) + " > " +
                std::to_string(pool.max_instances)));
    }
    if (pool.max_age_ms <= 0 || pool.idle_timeout_ms <= 0 || pool.sweep_interval_ms <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool durations must be positive"));
    }
    if (pool.acquire_timeout_ms < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.acquire_timeout_ms must not be negative"));
    }
    if (config.render.batch_concurrency == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "render.batch_concurrency must be at least 1"));
    }
    if (config.render.page_load_timeout_ms <= 0 || config.render.capture_timeout_ms <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "render timeouts must be positive"));
    }
    if (config.render.device_scale_factor <= 0.0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "render.device_scale_factor must be positive"));
    }
    return {};
}

} // namespace prism

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "prism/core/config.hpp"

namespace {

void set_env(const char* name, const char* value) {
    ::setenv(name, value, 1);
}

void unset_env(const char* name) {
    ::unsetenv(name);
}

} // namespace

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = prism::default_config();

    SECTION("pool defaults") {
        CHECK(cfg.pool.min_instances == 1);
        CHECK(cfg.pool.max_instances == 5);
        CHECK(cfg.pool.max_age_ms == 3600000);
        CHECK(cfg.pool.idle_timeout_ms == 300000);
        CHECK(cfg.pool.acquire_timeout_ms == 0);
    }

    SECTION("render defaults") {
        CHECK(cfg.render.default_viewport_width == 1920);
        CHECK(cfg.render.default_viewport_height == 1080);
        CHECK(cfg.render.screenshot_quality == 90);
        CHECK(cfg.render.slide_width == "1280px");
        CHECK(cfg.render.slide_height == "720px");
        CHECK(cfg.render.batch_concurrency == 3);
        CHECK(cfg.render.compliance_min_score == 0.997);
    }

    SECTION("browser and server defaults") {
        CHECK(cfg.browser.headless);
        CHECK_FALSE(cfg.browser.chrome_path.has_value());
        CHECK(cfg.server.port == 8081);
        CHECK(cfg.log_level == "info");
    }

    SECTION("defaults validate") {
        CHECK(prism::validate_config(cfg).has_value());
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "prism_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "pool": { "min_instances": 2, "max_instances": 4 },
            "render": { "slide_width": "1920px" },
            "browser": { "chrome_path": "/opt/chrome/chrome" },
            "log_level": "debug"
        })";
    }

    auto cfg = prism::load_config(tmp);

    CHECK(cfg.pool.min_instances == 2);
    CHECK(cfg.pool.max_instances == 4);
    CHECK(cfg.render.slide_width == "1920px");
    REQUIRE(cfg.browser.chrome_path.has_value());
    CHECK(*cfg.browser.chrome_path == "/opt/chrome/chrome");
    CHECK(cfg.log_level == "debug");
    // Non-specified fields keep defaults
    CHECK(cfg.render.slide_height == "720px");
    CHECK(cfg.pool.idle_timeout_ms == 300000);

    fs::remove(tmp);
}

TEST_CASE("load_config returns defaults for missing or malformed files", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing") {
        auto cfg = prism::load_config("/nonexistent/path/config.json");
        CHECK(cfg.server.port == 8081);
        CHECK(cfg.log_level == "info");
    }

    SECTION("malformed") {
        auto tmp = fs::temp_directory_path() / "prism_test_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = prism::load_config(tmp);
        CHECK(cfg.pool.max_instances == 5);
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env reads environment variables", "[config]") {
    set_env("BROWSER_POOL_MIN", "0");
    set_env("BROWSER_POOL_MAX", "8");
    set_env("BROWSER_IDLE_TIMEOUT", "1000");
    set_env("PUPPETEER_HEADLESS", "false");
    set_env("SLIDE_WIDTH", "1024px");
    set_env("COMPLIANCE_MIN_SCORE", "0.5");
    set_env("PORT", "9090");
    set_env("PRISM_LOG_LEVEL", "trace");

    auto cfg = prism::load_config_from_env();

    CHECK(cfg.pool.min_instances == 0);
    CHECK(cfg.pool.max_instances == 8);
    CHECK(cfg.pool.idle_timeout_ms == 1000);
    CHECK_FALSE(cfg.browser.headless);
    CHECK(cfg.render.slide_width == "1024px");
    CHECK(cfg.render.compliance_min_score == 0.5);
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.log_level == "trace");

    for (const char* name : {"BROWSER_POOL_MIN", "BROWSER_POOL_MAX", "BROWSER_IDLE_TIMEOUT",
                             "PUPPETEER_HEADLESS", "SLIDE_WIDTH", "COMPLIANCE_MIN_SCORE",
                             "PORT", "PRISM_LOG_LEVEL"}) {
        unset_env(name);
    }
}

TEST_CASE("load_config_from_env ignores unparseable numbers", "[config]") {
    set_env("BROWSER_POOL_MAX", "lots");
    prism::Config base;
    base.pool.max_instances = 3;

    auto cfg = prism::load_config_from_env(base);
    CHECK(cfg.pool.max_instances == 3);

    unset_env("BROWSER_POOL_MAX");
}

TEST_CASE("load_env_file applies KEY=VALUE lines", "[config]") {
    namespace fs = std::filesystem;
    auto tmp = fs::temp_directory_path() / "prism_test.env";
    {
        std::ofstream out(tmp);
        out << "# comment\n"
            << "PRISM_TEST_PLAIN=plain value # trailing\n"
            << "export PRISM_TEST_EXPORTED=yes\n"
            << "PRISM_TEST_QUOTED=\"quoted # kept\"\n"
            << "not a pair\n"
            << "PRISM_TEST_EXISTING=from-file\n";
    }
    set_env("PRISM_TEST_EXISTING", "from-env");

    SECTION("existing variables win by default") {
        auto applied = prism::load_env_file(tmp);
        CHECK(applied == 3);
        CHECK(std::string(std::getenv("PRISM_TEST_PLAIN")) == "plain value");
        CHECK(std::string(std::getenv("PRISM_TEST_EXPORTED")) == "yes");
        CHECK(std::string(std::getenv("PRISM_TEST_QUOTED")) == "quoted # kept");
        CHECK(std::string(std::getenv("PRISM_TEST_EXISTING")) == "from-env");
    }

    SECTION("overwrite replaces existing variables") {
        auto applied = prism::load_env_file(tmp, true);
        CHECK(applied == 4);
        CHECK(std::string(std::getenv("PRISM_TEST_EXISTING")) == "from-file");
    }

    SECTION("missing file applies nothing") {
        CHECK(prism::load_env_file("/nonexistent/.env") == 0);
    }

    for (const char* name : {"PRISM_TEST_PLAIN", "PRISM_TEST_EXPORTED", "PRISM_TEST_QUOTED",
                             "PRISM_TEST_EXISTING"}) {
        unset_env(name);
    }
    fs::remove(tmp);
}

TEST_CASE("validate_config rejects unusable settings", "[config]") {
    prism::Config cfg;

    SECTION("min above max") {
        cfg.pool.min_instances = 6;
        cfg.pool.max_instances = 5;
        auto result = prism::validate_config(cfg);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == prism::ErrorCode::InvalidConfig);
    }

    SECTION("zero max") {
        cfg.pool.min_instances = 0;
        cfg.pool.max_instances = 0;
        CHECK_FALSE(prism::validate_config(cfg).has_value());
    }

    SECTION("zero batch concurrency") {
        cfg.render.batch_concurrency = 0;
        CHECK_FALSE(prism::validate_config(cfg).has_value());
    }

    SECTION("non-positive timeouts") {
        cfg.render.page_load_timeout_ms = 0;
        CHECK_FALSE(prism::validate_config(cfg).has_value());
    }

    SECTION("min equal to max is allowed") {
        cfg.pool.min_instances = 2;
        cfg.pool.max_instances = 2;
        CHECK(prism::validate_config(cfg).has_value());
    }
}

TEST_CASE("Config JSON round trip keeps nested sections", "[config]") {
    prism::Config cfg;
    cfg.pool.max_instances = 7;
    cfg.browser.extra_args = {"--lang=en-US"};

    nlohmann::json j = cfg;
    CHECK(j["pool"]["max_instances"] == 7);
    CHECK(j["browser"]["extra_args"][0] == "--lang=en-US");
    CHECK(j["browser"]["chrome_path"].is_null());

    auto back = j.get<prism::Config>();
    CHECK(back.pool.max_instances == 7);
    CHECK(back.browser.extra_args.size() == 1);
}

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "prism/cli/app.hpp"
#include "prism/cli/commands.hpp"

using namespace prism;
namespace fs = std::filesystem;

namespace {

/// Redirects a stream into a string for the lifetime of the guard.
class CaptureStream {
public:
    explicit CaptureStream(std::ostream& stream)
        : stream_(stream), saved_(stream.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStream() { stream_.rdbuf(saved_); }

    auto str() const -> std::string { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* saved_;
};

auto run_app(std::vector<std::string> args) -> int {
    args.insert(args.begin(), "prism");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    cli::App app;
    return app.run(static_cast<int>(argv.size()), argv.data());
}

auto write_temp(const std::string& name, const std::string& content) -> fs::path {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST_CASE("resolve_config layers file, env file and flags", "[cli]") {
    auto config_path = write_temp("prism_cli_config.json",
        R"({"pool": {"min_instances": 2, "max_instances": 4}, "server": {"port": 9100}})");

    SECTION("config file without overrides") {
        cli::GlobalOptions options;
        options.config_path = config_path.string();
        options.env_file = "/nonexistent/prism.env";

        auto config = cli::resolve_config(options);
        REQUIRE(config.has_value());
        CHECK(config->pool.min_instances == 2);
        CHECK(config->pool.max_instances == 4);
        CHECK(config->server.port == 9100);
        CHECK(config->log_level == "info");
    }

    SECTION("env file overrides the config file") {
        ::unsetenv("BROWSER_POOL_MAX");
        auto env_path = write_temp("prism_cli_test.env", "BROWSER_POOL_MAX=7\n");

        cli::GlobalOptions options;
        options.config_path = config_path.string();
        options.env_file = env_path.string();

        auto config = cli::resolve_config(options);
        ::unsetenv("BROWSER_POOL_MAX");
        fs::remove(env_path);

        REQUIRE(config.has_value());
        CHECK(config->pool.min_instances == 2);
        CHECK(config->pool.max_instances == 7);
    }

    SECTION("log level flag wins") {
        cli::GlobalOptions options;
        options.env_file = "/nonexistent/prism.env";
        options.log_level = "debug";

        auto config = cli::resolve_config(options);
        REQUIRE(config.has_value());
        CHECK(config->log_level == "debug");
    }

    SECTION("inconsistent bounds are rejected") {
        ::setenv("BROWSER_POOL_MIN", "9", 1);
        cli::GlobalOptions options;
        options.config_path = config_path.string();
        options.env_file = "/nonexistent/prism.env";

        auto config = cli::resolve_config(options);
        ::unsetenv("BROWSER_POOL_MIN");

        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == ErrorCode::InvalidConfig);
    }

    fs::remove(config_path);
}

TEST_CASE("App dispatches subcommands", "[cli]") {
    SECTION("version prints the build") {
        CaptureStream out(std::cout);
        CHECK(run_app({"version"}) == 0);
        CHECK(out.str().starts_with("prism "));
        CHECK(out.str().find("C++ standard:") != std::string::npos);
    }

    SECTION("config prints the effective configuration") {
        CaptureStream out(std::cout);
        CHECK(run_app({"--env-file", "/nonexistent/prism.env", "--log-level", "warn", "config"}) == 0);

        auto printed = nlohmann::json::parse(out.str());
        CHECK(printed["log_level"] == "warn");
        CHECK(printed["pool"]["max_instances"] == 5);
    }

    SECTION("config --validate") {
        CaptureStream out(std::cout);
        CHECK(run_app({"--env-file", "/nonexistent/prism.env", "config", "--validate"}) == 0);
        CHECK(out.str() == "Configuration is valid.\n");
    }

    SECTION("invalid configuration exits with code 2") {
        ::setenv("BROWSER_POOL_MIN", "10", 1);
        CaptureStream err(std::cerr);
        auto code = run_app({"--env-file", "/nonexistent/prism.env", "config", "--validate"});
        ::unsetenv("BROWSER_POOL_MIN");

        CHECK(code == 2);
        CHECK(err.str().find("Invalid configuration") != std::string::npos);
    }

    SECTION("a subcommand is required") {
        CaptureStream err(std::cerr);
        CaptureStream out(std::cout);
        CHECK(run_app({}) != 0);
    }

    SECTION("unknown log levels are rejected") {
        CaptureStream err(std::cerr);
        CaptureStream out(std::cout);
        CHECK(run_app({"--log-level", "verbose", "version"}) != 0);
    }
}

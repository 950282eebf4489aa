#include "prism/cli/app.hpp"
#include "prism/core/logger.hpp"

// Version string; typically injected by CMake via -DPRISM_VERSION_STRING=...
#ifndef PRISM_VERSION_STRING
#define PRISM_VERSION_STRING "0.1.0-dev"
#endif

namespace prism::cli {

App::App()
    : cli_("prism", "Headless-browser HTML rendering service")
{
    cli_.set_version_flag("--version", PRISM_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("PRISM_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    cli_.add_option("--env-file", options_.env_file,
                    "Environment file applied before reading configuration")
        ->capture_default_str();

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Subcommands report failure by throwing CLI::RuntimeError(code).
        auto code = cli_.exit(e);
        Logger::flush();
        return code;
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_serve_command(cli_, options_);
    register_render_command(cli_, options_);
    register_config_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace prism::cli

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "prism/core/config.hpp"
#include "prism/core/error.hpp"

namespace prism::cli {

/// Options shared by every subcommand.
struct GlobalOptions {
    std::string config_path;      // JSON config file, optional
    std::string log_level;        // overrides PRISM_LOG_LEVEL when set
    std::string env_file = ".env";
};

/// Applies the .env file, the JSON config file and the environment overlay
/// (in that order), then validates the result.
auto resolve_config(const GlobalOptions& options) -> Result<Config>;

/// `serve`: runs the HTTP render server until SIGINT/SIGTERM.
void register_serve_command(CLI::App& app, GlobalOptions& options);

/// `render`: renders one HTML file to an image or PDF file and exits.
void register_render_command(CLI::App& app, GlobalOptions& options);

/// `config`: prints or validates the resolved configuration.
void register_config_command(CLI::App& app, GlobalOptions& options);

/// `version`: prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace prism::cli

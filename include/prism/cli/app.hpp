#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "prism/cli/commands.hpp"

namespace prism::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (serve, render, config, version). Each
/// subcommand resolves its own configuration from the global options.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto options() const -> const GlobalOptions&;

private:
    void setup_commands();

    CLI::App cli_;
    GlobalOptions options_;
};

} // namespace prism::cli

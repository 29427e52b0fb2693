#pragma once

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "clawguard/core/config.hpp"

namespace clawguard::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration
/// (file, then CLAWGUARD_* environment, then command-line overrides) and
/// dispatches to the selected subcommand (fetch, health, check, version).
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

    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    /// Runs once parsing is complete, before any subcommand callback.
    void load_configuration();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::optional<std::string> log_level_;
    int exit_code_ = 0;
};

} // namespace clawguard::cli

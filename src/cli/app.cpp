#include "clawguard/cli/app.hpp"
#include "clawguard/cli/commands.hpp"
#include "clawguard/core/correlation.hpp"
#include "clawguard/core/logger.hpp"
#include "clawguard/net/constants.hpp"

#include <filesystem>

namespace clawguard::cli {

App::App()
    : cli_("clawguard", "Secure outbound HTTP client with SSRF and DNS rebinding protection")
{
    cli_.set_version_flag("--version", CLAWGUARD_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("CLAWGUARD_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.require_subcommand(1);
    cli_.parse_complete_callback([this]() { load_configuration(); });

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already run inside parse().
    Logger::flush();
    return exit_code_;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::load_configuration() {
    // Bring the logger up before loading so config warnings are visible.
    Logger::init("clawguard", log_level_.value_or("warn"));

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config_ = load_config(std::filesystem::path(config_path_));
    }
    apply_env_overrides(config_);
    if (log_level_) {
        config_.log_level = *log_level_;
    }
    Logger::set_level(config_.log_level);

    auto id = correlation::init_from_env();
    LOG_DEBUG("Correlation ID: {}", id);
}

void App::setup_commands() {
    register_fetch_command(cli_, config_, exit_code_);
    register_health_command(cli_, config_, exit_code_);
    register_check_command(cli_, config_, exit_code_);
    register_version_command(cli_);
}

} // namespace clawguard::cli

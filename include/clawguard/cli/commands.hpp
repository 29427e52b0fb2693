#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <CLI/CLI.hpp>

#include "clawguard/core/config.hpp"
#include "clawguard/core/error.hpp"
#include "clawguard/core/types.hpp"

namespace clawguard::cli {

/// Drives one client coroutine to completion on a private io_context.
/// The context is stopped as soon as the coroutine finishes, so work it
/// abandoned (a timed-out DNS lookup) cannot hold the caller.
template <typename T>
auto run_sync(boost::asio::awaitable<T> op) -> T {
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr failure;

    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await std::move(op);
        },
        [&](std::exception_ptr e) {
            failure = e;
            ioc.stop();
        });
    ioc.run();

    if (failure) std::rethrow_exception(failure);
    return std::move(*result);
}

/// Parses repeated "Name: Value" arguments into a header map.
auto parse_header_args(const std::vector<std::string>& args) -> Result<HeaderMap>;

/// Register the `fetch` subcommand.
/// Performs one validated request and prints the response body.
void register_fetch_command(CLI::App& app, const Config& config, int& exit_code);

/// Register the `health` subcommand.
/// Checks a URL and prints the health status as JSON.
void register_health_command(CLI::App& app, const Config& config, int& exit_code);

/// Register the `check` subcommand.
/// Runs the validation stages for a URL without sending anything.
void register_check_command(CLI::App& app, const Config& config, int& exit_code);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace clawguard::cli

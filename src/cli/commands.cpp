#include "clawguard/cli/commands.hpp"
#include "clawguard/core/logger.hpp"
#include "clawguard/core/utils.hpp"
#include "clawguard/net/constants.hpp"
#include "clawguard/net/lifecycle.hpp"
#include "clawguard/net/secure_client.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>

namespace clawguard::cli {

namespace {

auto make_options(std::optional<int64_t> timeout_ms, bool allow_private, bool audit,
                  HeaderMap headers) -> net::RequestOptions {
    net::RequestOptions options;
    options.headers = std::move(headers);
    if (timeout_ms) {
        options = net::with_timeout(std::chrono::milliseconds(*timeout_ms), std::move(options));
    }
    if (allow_private) {
        options = net::allow_private_ips(std::move(options));
    }
    if (audit) {
        options = net::with_audit(std::move(options));
    }
    return options;
}

void print_failure(const net::RequestFailure& failure) {
    std::cerr << "error [" << failure.code_string() << "]: " << failure.error.what() << "\n";
    if (failure.status != 0) {
        std::cerr << "  status: " << failure.status << "\n";
    }
}

} // anonymous namespace

auto parse_header_args(const std::vector<std::string>& args) -> Result<HeaderMap> {
    HeaderMap headers;
    for (const auto& arg : args) {
        auto colon = arg.find(':');
        if (colon == std::string::npos) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Header must be 'Name: Value'", arg));
        }
        auto name = utils::trim(std::string_view(arg).substr(0, colon));
        if (name.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Header name is empty", arg));
        }
        headers[name] = utils::trim(std::string_view(arg).substr(colon + 1));
    }
    return headers;
}

// ---------------------------------------------------------------------------
// fetch command
// ---------------------------------------------------------------------------

void register_fetch_command(CLI::App& app, const Config& config, int& exit_code) {
    auto* sub = app.add_subcommand("fetch", "Send a validated HTTP request and print the body");

    struct FetchArgs {
        std::string url;
        std::string method = "GET";
        std::vector<std::string> headers;
        std::string data;
        std::optional<int64_t> timeout_ms;
        bool allow_private = false;
        bool audit = false;
        bool include = false;
    };
    auto args = std::make_shared<FetchArgs>();

    sub->add_option("url", args->url, "Target URL")->required();
    sub->add_option("-X,--method", args->method, "HTTP method")->default_val("GET");
    sub->add_option("-H,--header", args->headers, "Request header 'Name: Value' (repeatable)");
    sub->add_option("-d,--data", args->data, "Request body");
    sub->add_option("--timeout", args->timeout_ms, "Timeout in milliseconds (clamped to 1000-60000)");
    sub->add_flag("--allow-private", args->allow_private,
                  "Allow private and internal targets for this request");
    sub->add_flag("--audit", args->audit, "Audit the call outcome");
    sub->add_flag("-i,--include", args->include, "Print status line and response headers");

    sub->callback([&config, &exit_code, args]() {
        auto headers = parse_header_args(args->headers);
        if (!headers) {
            std::cerr << "error: " << headers.error().what() << "\n";
            exit_code = 2;
            return;
        }

        auto client = net::make_secure_client(config.client, config.audit_log_path);
        net::HttpRequest request{
            .method = args->method,
            .url = args->url,
            .body = args->data,
            .options = make_options(args->timeout_ms, args->allow_private, args->audit,
                                    std::move(*headers)),
        };

        auto result = run_sync(client->request(std::move(request)));
        if (!result) {
            print_failure(result.error());
            exit_code = 1;
            return;
        }

        if (args->include) {
            std::cout << "HTTP " << result->status << "\n";
            for (const auto& [name, value] : result->headers) {
                std::cout << name << ": " << value << "\n";
            }
            std::cout << "\n";
        }
        std::cout << result->body;
        if (!result->body.empty() && result->body.back() != '\n') {
            std::cout << "\n";
        }
        LOG_DEBUG("Completed in {}ms after {} redirect(s)",
                  result->meta.duration.count(), result->meta.redirects);
        exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// health command
// ---------------------------------------------------------------------------

void register_health_command(CLI::App& app, const Config& config, int& exit_code) {
    auto* sub = app.add_subcommand("health", "Check a URL and report its health as JSON");

    auto url = std::make_shared<std::string>();
    auto timeout_ms = std::make_shared<std::optional<int64_t>>();
    auto allow_private = std::make_shared<bool>(false);

    sub->add_option("url", *url, "URL to check")->required();
    sub->add_option("--timeout", *timeout_ms, "Timeout in milliseconds (default 5000)");
    sub->add_flag("--allow-private", *allow_private, "Allow private and internal targets");

    sub->callback([&config, &exit_code, url, timeout_ms, allow_private]() {
        auto client = net::make_secure_client(config.client, config.audit_log_path);
        auto options = make_options(*timeout_ms, *allow_private, false, {});

        auto status = run_sync(client->health_check(*url, std::move(options)));

        json j = {
            {"healthy", status.healthy},
            {"status", status.status},
            {"responseTime", status.response_time.count()},
            {"error", status.error ? json(*status.error) : json(nullptr)},
        };
        std::cout << j.dump(2) << "\n";
        exit_code = status.healthy ? 0 : 1;
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, const Config& config, int& exit_code) {
    auto* sub = app.add_subcommand("check", "Validate a URL without sending a request");

    auto url = std::make_shared<std::string>();
    auto header_args = std::make_shared<std::vector<std::string>>();
    auto allow_private = std::make_shared<bool>(false);

    sub->add_option("url", *url, "URL to validate")->required();
    sub->add_option("-H,--header", *header_args, "Request header 'Name: Value' (repeatable)");
    sub->add_flag("--allow-private", *allow_private, "Allow private and internal targets");

    sub->callback([&config, &exit_code, url, header_args, allow_private]() {
        auto headers = parse_header_args(*header_args);
        if (!headers) {
            std::cerr << "error: " << headers.error().what() << "\n";
            exit_code = 2;
            return;
        }

        auto client = net::make_secure_client(config.client, config.audit_log_path);
        auto options = make_options(std::nullopt, *allow_private, false, std::move(*headers));

        for (auto stage : net::SecureHttpClient::pipeline_stages()) {
            LOG_DEBUG("check stage: {}", net::pipeline_stage_name(stage));
        }

        auto verdict = run_sync(client->check(*url, std::move(options)));
        if (!verdict) {
            std::cout << "BLOCKED [" << error_code_to_string(verdict.error().code()) << "] "
                      << verdict.error().what() << "\n";
            exit_code = 1;
            return;
        }
        std::cout << "OK " << *url << "\n";
        exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "clawguard " << CLAWGUARD_VERSION_STRING << "\n";
        std::cout << "User-Agent: " << net::kUserAgent << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace clawguard::cli

/**
 * @file main.cpp
 * @brief Entry point for restkit_cli: one HTTP exchange from the command line
 *
 * Exit codes:
 * - 0 the exchange completed (whatever the HTTP status)
 * - 1 the exchange failed (construction, transport or body read)
 * - 2 invalid arguments
 */

#include "cli/cli_config.h"
#include "core/codec/json_codec.h"
#include "core/net/http_client.h"
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

void print_headers(const restkit::nethttp::Headers& headers) {
    for (const auto& line : headers.to_lines()) {
        std::cout << line << "\n";
    }
}

int run_allow(const restkit::nethttp::HttpExchangeClient& client, const restkit::cli::CliOptions& options) {
    auto result = client.options_for_allow(options.url);
    for (const auto& m : result.methods) {
        std::cout << m << "\n";
    }
    if (result.error) {
        spdlog::error("OPTIONS {} failed: {}", options.url, result.error->describe());
        return 1;
    }
    return 0;
}

int run_exchange(const restkit::nethttp::HttpExchangeClient& client, const restkit::cli::CliOptions& options) {
    auto callback = [&options](restkit::nethttp::Request& req) {
        if (options.json) {
            restkit::codec::json_request_callback(req);
        }
        for (const auto& h : options.headers) {
            req.headers.add_line(h);
        }
    };

    std::istringstream body(options.data.value_or(std::string{}));
    auto result = client.exchange(options.url, options.method, options.data ? &body : nullptr, callback);
    if (result.error) {
        spdlog::error("{} {} failed: {}", options.method, options.url, result.error->describe());
        return 1;
    }

    std::cout << "HTTP " << result.entity.status_code << "\n";
    print_headers(result.entity.headers);
    std::cout << "\n" << result.entity.body_string();
    if (!result.entity.body.empty() && result.entity.body.back() != '\n') {
        std::cout << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = restkit::cli::parse_command_line_args(argc, argv);
    if (!restkit::cli::validate_options(options)) {
        return 2;
    }
    if (!restkit::cli::initialize_logging(options.verbose)) {
        return 1;
    }

    try {
        restkit::nethttp::HttpExchangeClient client(options.client);
        return options.allow ? run_allow(client, options) : run_exchange(client, options);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

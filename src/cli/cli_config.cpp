#include "cli/cli_config.h"
#include "core/net/http_request.h"
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <iostream>

namespace restkit {
namespace cli {

namespace {
constexpr int kUsageExitCode = 2;
}

CliOptions parse_command_line_args(int argc, char* argv[]) {
    args::ArgumentParser parser("restkit HTTP exchange client",
                                "Performs one HTTP exchange and prints the normalized response.");

    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> url(parser, "url", "Absolute request URL [REQUIRED]", {"url"});
    args::ValueFlag<std::string> method(parser, "method", "HTTP method (default: GET)", {'X', "method"});
    args::ValueFlagList<std::string> headers(parser, "header", "Request header \"Name: value\" (repeatable)",
                                             {'H', "header"});
    args::ValueFlag<std::string> data(parser, "body", "Request body", {'d', "data"});
    args::Flag json(parser, "json", "Send JSON Accept/Content-Type/Cache-Control headers", {"json"});
    args::Flag allow(parser, "allow", "Send OPTIONS and print the Allow methods", {"allow"});
    args::ValueFlag<long> timeout_ms(parser, "ms", "Overall request timeout in ms (default: 10000)",
                                     {"timeout-ms"});
    args::ValueFlag<long> connect_timeout_ms(parser, "ms", "Connect/TLS timeout in ms (default: 5000)",
                                             {"connect-timeout-ms"});
    args::Flag verbose(parser, "verbose", "Debug logging", {'v', "verbose"});

    CliOptions options;

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Completion& e) {
        std::cout << e.what();
        std::exit(0);
    } catch (const args::Help&) {
        std::cout << parser;
        std::cout << "\nExamples:\n";
        std::cout << "  " << argv[0] << " --url http://localhost:8080/items\n";
        std::cout << "  " << argv[0] << " -X POST --json --url http://localhost:8080/items -d '{\"name\":\"x\"}'\n";
        std::cout << "  " << argv[0] << " --allow --url http://localhost:8080/items\n\n";
        std::exit(0);
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        std::exit(kUsageExitCode);
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        std::exit(kUsageExitCode);
    }

    if (url) options.url = args::get(url);
    if (method) options.method = args::get(method);
    if (headers) options.headers = args::get(headers);
    if (data) options.data = args::get(data);
    if (timeout_ms) options.client.request_timeout = std::chrono::milliseconds(args::get(timeout_ms));
    if (connect_timeout_ms) options.client.connect_timeout = std::chrono::milliseconds(args::get(connect_timeout_ms));

    options.json = json ? true : false;
    options.allow = allow ? true : false;
    options.verbose = verbose ? true : false;

    return options;
}

bool validate_options(const CliOptions& options) {
    std::vector<std::string> errors;

    if (options.url.empty()) {
        errors.push_back("--url is required");
    }
    if (!nethttp::is_valid_method(options.method)) {
        errors.push_back("--method '" + options.method + "' is not a valid HTTP method token");
    }
    if (options.allow && options.data) {
        errors.push_back("--allow does not take a request body");
    }
    if (options.client.request_timeout.count() <= 0) {
        errors.push_back("--timeout-ms must be positive");
    }
    if (options.client.connect_timeout.count() <= 0) {
        errors.push_back("--connect-timeout-ms must be positive");
    }
    for (const auto& h : options.headers) {
        auto colon = h.find(':');
        if (colon == std::string::npos || colon == 0) {
            errors.push_back("--header '" + h + "' is not of the form \"Name: value\"");
        }
    }

    if (!errors.empty()) {
        std::cerr << "Configuration errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return true;
}

bool initialize_logging(bool verbose) {
    try {
        // stderr keeps stdout for the response itself
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        auto logger = std::make_shared<spdlog::logger>("restkit", console_sink);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [TID:%t] [%^%l%$] %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

        spdlog::set_default_logger(logger);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace cli
} // namespace restkit

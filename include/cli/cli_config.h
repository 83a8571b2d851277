#pragma once

#include "core/net/client_config.h"
#include <optional>
#include <string>
#include <vector>

namespace restkit {
namespace cli {

struct CliOptions {
    std::string url;
    std::string method = "GET";
    std::vector<std::string> headers;   // raw "Name: value" flags
    std::optional<std::string> data;
    bool json = false;
    bool allow = false;
    bool verbose = false;
    nethttp::ClientConfig client;
};

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument vector
 * @return Parsed options; exits the process on --help or a parse error
 */
CliOptions parse_command_line_args(int argc, char* argv[]);

/**
 * @brief Validate options
 * @param options Options to validate
 * @return true if valid, false otherwise (errors printed to stderr)
 */
bool validate_options(const CliOptions& options);

/**
 * @brief Initialize logging system
 * @param verbose Lower the level to debug so exchanges are traced
 * @return true if successful, false otherwise
 */
bool initialize_logging(bool verbose);

} // namespace cli
} // namespace restkit

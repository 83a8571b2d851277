#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace restkit {
namespace utils {

/**
 * @brief Strip leading and trailing spaces, tabs, CR and LF
 */
std::string trim_ascii(std::string_view input);

/**
 * @brief Split on every occurrence of sep without trimming the pieces
 * @return Always at least one element; "a,,b" yields {"a", "", "b"}
 */
std::vector<std::string> split_raw(std::string_view input, char sep);

} // namespace utils
} // namespace restkit

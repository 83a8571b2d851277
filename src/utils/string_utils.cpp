#include "utils/string_utils.h"

namespace restkit {
namespace utils {

std::string trim_ascii(std::string_view input) {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    std::size_t begin = 0;
    std::size_t end = input.size();
    while (begin < end && is_space(input[begin])) ++begin;
    while (end > begin && is_space(input[end - 1])) --end;
    return std::string(input.substr(begin, end - begin));
}

std::vector<std::string> split_raw(std::string_view input, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = input.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(input.substr(start));
            break;
        }
        parts.emplace_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace utils
} // namespace restkit

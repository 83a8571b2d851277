/**
 * @file http_request.cpp
 */

#include "core/net/http_request.h"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace restkit::nethttp {

bool is_valid_method(std::string_view method) {
    static constexpr const char* kTokenPunct = "!#$%&'*+-.^_`|~";
    if (method.empty()) {
        return false;
    }
    return std::all_of(method.begin(), method.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) || (c != '\0' && std::strchr(kTokenPunct, c) != nullptr);
    });
}

} // namespace restkit::nethttp

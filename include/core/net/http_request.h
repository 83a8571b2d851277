/**
 * @file http_request.h
 * @brief Mutable outbound request handed to request callbacks before dispatch.
 */

#pragma once

#include "core/net/http_headers.h"
#include <functional>
#include <string>
#include <string_view>

namespace restkit::nethttp {

namespace method {
inline constexpr std::string_view kGet = "GET";
inline constexpr std::string_view kHead = "HEAD";
inline constexpr std::string_view kPost = "POST";
inline constexpr std::string_view kPut = "PUT";
inline constexpr std::string_view kPatch = "PATCH";
inline constexpr std::string_view kDelete = "DELETE";
inline constexpr std::string_view kOptions = "OPTIONS";
} // namespace method

// True when method is a non-empty RFC 7230 token.
bool is_valid_method(std::string_view method);

struct Request {
    std::string method;
    std::string url;
    Headers headers;
    std::string body;
};

// Invoked exactly once per exchange, synchronously, before dispatch.
using RequestCallback = std::function<void(Request&)>;

} // namespace restkit::nethttp

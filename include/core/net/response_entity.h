/**
 * @file response_entity.h
 * @brief Normalized result of one HTTP exchange.
 */

#pragma once

#include "core/net/http_headers.h"
#include <string>
#include <string_view>

namespace restkit::nethttp {

/**
 * @struct ResponseEntity
 * @brief Status, headers and fully buffered body of a response
 *
 * A default-constructed entity (status 0, no headers, empty body) is what
 * every failed exchange hands back.
 */
struct ResponseEntity {
    long status_code = 0;
    Headers headers;
    std::string body;

    std::string_view body_string() const { return body; }
};

} // namespace restkit::nethttp

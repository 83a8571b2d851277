/**
 * @file json_codec.h
 * @brief JSON helpers around exchange bodies (nlohmann/json).
 */

#pragma once

#include "core/net/http_request.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace restkit::codec {

struct JsonError {
    int id = 0;             // nlohmann exception id, 0 when not from the parser
    std::string message;
};

/**
 * @brief Serialize value into out, newline terminated
 * @return Error on failure, out is left empty
 */
template <typename T>
std::optional<JsonError> try_encode_json(const T& value, std::string& out) {
    out.clear();
    try {
        out = nlohmann::json(value).dump();
        out.push_back('\n');
    } catch (const nlohmann::json::exception& e) {
        out.clear();
        return JsonError{e.id, e.what()};
    }
    return std::nullopt;
}

/**
 * @brief Serialize value into a readable stream
 *
 * A serialization failure yields an empty stream and is not reported to the
 * caller; use try_encode_json() when the failure matters.
 */
template <typename T>
std::istringstream encode_json(const T& value) {
    std::string out;
    if (auto err = try_encode_json(value, out)) {
        spdlog::debug("[JSON] encode failed, sending empty body: {}", err->message);
    }
    return std::istringstream(std::move(out));
}

// Parses the first JSON document in bytes; anything after it is ignored.
std::optional<JsonError> parse_json(std::string_view bytes, nlohmann::json& out);

/**
 * @brief Decode the first JSON value in bytes into target
 * @return Parse or schema error, nullopt on success
 */
template <typename T>
std::optional<JsonError> decode_json(std::string_view bytes, T& target) {
    nlohmann::json doc;
    if (auto err = parse_json(bytes, doc)) {
        return err;
    }
    try {
        doc.get_to(target);
    } catch (const nlohmann::json::exception& e) {
        return JsonError{e.id, e.what()};
    }
    return std::nullopt;
}

inline std::optional<JsonError> decode_json(std::string_view bytes, nlohmann::json& target) {
    return parse_json(bytes, target);
}

// Sets Accept and Content-Type to application/json and Cache-Control to no-cache.
void json_request_callback(nethttp::Request& req);

} // namespace restkit::codec

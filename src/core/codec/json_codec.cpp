/**
 * @file json_codec.cpp
 */

#include "core/codec/json_codec.h"

namespace restkit::codec {

std::optional<JsonError> parse_json(std::string_view bytes, nlohmann::json& out) {
    std::istringstream in{std::string(bytes)};
    try {
        in >> out;
    } catch (const nlohmann::json::exception& e) {
        return JsonError{e.id, e.what()};
    }
    return std::nullopt;
}

void json_request_callback(nethttp::Request& req) {
    req.headers.add("Accept", "application/json");
    req.headers.add("Content-Type", "application/json");
    req.headers.add("Cache-Control", "no-cache");
}

} // namespace restkit::codec

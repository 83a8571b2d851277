/**
 * @file exchange_error.cpp
 */

#include "core/net/exchange_error.h"
#include <curl/curl.h>

namespace restkit::nethttp {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Construction: return "construction";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::BodyRead: return "body_read";
    }
    return "unknown";
}

bool ExchangeError::timed_out() const {
    return transport_code == static_cast<int>(CURLE_OPERATION_TIMEDOUT);
}

std::string ExchangeError::describe() const {
    std::string out = "[" + to_string(kind) + "] " + message;
    if (transport_code != 0) {
        out += " (curl code " + std::to_string(transport_code) + ")";
    }
    return out;
}

} // namespace restkit::nethttp

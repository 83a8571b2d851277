/**
 * @file exchange_error.h
 * @brief Error value returned by a failed exchange.
 */

#pragma once

#include <string>

namespace restkit::nethttp {

enum class ErrorKind {
    Construction,   // bad method, URL or body; nothing was sent
    Transport,      // connect, DNS, TLS or deadline failure
    BodyRead        // failure while draining the response body
};

std::string to_string(ErrorKind kind);

struct ExchangeError {
    ErrorKind kind = ErrorKind::Transport;
    int transport_code = 0;     // CURLcode of the failed transfer, 0 when none
    std::string message;

    // True when the transfer was cut off by the per-call deadline or the
    // connect timeout.
    bool timed_out() const;

    std::string describe() const;
};

} // namespace restkit::nethttp

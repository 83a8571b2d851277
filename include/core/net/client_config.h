/**
 * @file client_config.h
 * @brief Construction-time settings for HttpExchangeClient.
 */

#pragma once

#include <chrono>

namespace restkit::nethttp {

inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{10'000};
inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{5'000};

struct ClientConfig {
    // Upper bound on a whole exchange, measured from the start of the call.
    std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};
    // Upper bound on TCP connect plus TLS handshake.
    std::chrono::milliseconds connect_timeout{kDefaultConnectTimeout};

    static ClientConfig defaults() { return ClientConfig{}; }
};

} // namespace restkit::nethttp

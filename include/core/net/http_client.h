/**
 * @file http_client.h
 * @brief HTTP exchange client over libcurl: one exchange primitive plus verb helpers.
 */

#pragma once

#include "core/net/client_config.h"
#include "core/net/exchange_error.h"
#include "core/net/http_headers.h"
#include "core/net/http_request.h"
#include "core/net/response_entity.h"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restkit::nethttp {

/**
 * @struct ExchangeResult
 * @brief Either a populated entity or an error, never both
 */
struct ExchangeResult {
    ResponseEntity entity;
    std::optional<ExchangeError> error;

    bool ok() const { return !error.has_value(); }
};

struct HeadResult {
    Headers headers;
    std::optional<ExchangeError> error;
};

struct AllowResult {
    std::vector<std::string> methods;
    std::optional<ExchangeError> error;
};

/**
 * @class CallDeadline
 * @brief Deadline scoped to a single exchange call
 */
class CallDeadline {
public:
    explicit CallDeadline(std::chrono::milliseconds budget);

    std::chrono::milliseconds remaining() const;
    bool expired() const;

private:
    std::chrono::steady_clock::time_point deadline_;
};

/**
 * @class HttpExchangeClient
 * @brief Blocking HTTP client with a fixed per-call timeout
 *
 * Every call goes through exchange(): the request is built, bound to a
 * fresh deadline, handed to the optional callback, sent, and the response
 * is fully buffered into a ResponseEntity. Failures come back as
 * ExchangeError values; nothing is retried.
 *
 * The connection, DNS and TLS session caches are shared between calls, so
 * one instance can serve many threads at once. Configuration is fixed at
 * construction.
 */
class HttpExchangeClient {
public:
    HttpExchangeClient();
    explicit HttpExchangeClient(ClientConfig config);
    ~HttpExchangeClient();

    HttpExchangeClient(const HttpExchangeClient&) = delete;
    HttpExchangeClient& operator=(const HttpExchangeClient&) = delete;
    HttpExchangeClient(HttpExchangeClient&&) = delete;
    HttpExchangeClient& operator=(HttpExchangeClient&&) = delete;

    /**
     * @brief Perform one request/response cycle
     * @param url Absolute URL; malformed URLs fail before anything is sent
     * @param method HTTP method token
     * @param body Optional request body, read to the end before dispatch
     * @param callback Optional hook, invoked once with the outbound request
     * @return Entity on success, otherwise an error and an empty entity
     */
    ExchangeResult exchange(const std::string& url,
                            std::string_view method,
                            std::istream* body = nullptr,
                            const RequestCallback& callback = {}) const;

    ExchangeResult get(const std::string& url) const;
    // Headers only; the status and any body are dropped.
    HeadResult head(const std::string& url) const;
    ExchangeResult post(const std::string& url, std::istream& body) const;
    ExchangeResult put(const std::string& url, std::istream& body) const;
    ExchangeResult patch(const std::string& url, std::istream& body) const;
    // Error only for construction or transport failure, never for an HTTP status.
    std::optional<ExchangeError> del(const std::string& url) const;

    /**
     * @brief OPTIONS request returning the raw comma split of the Allow header
     *
     * Tokens are not trimmed: "POST, GET" yields {"POST", " GET"}. The error,
     * if any, is returned next to whatever list was derived.
     */
    AllowResult options_for_allow(const std::string& url) const;

    const ClientConfig& config() const { return config_; }

private:
    struct Transport;

    ExchangeResult dispatch(const Request& req, const CallDeadline& deadline) const;

    ClientConfig config_;
    std::unique_ptr<Transport> transport_;
};

} // namespace restkit::nethttp

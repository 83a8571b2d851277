/**
 * @file test_http_server.h
 * @brief In-process HTTP/1.1 server for exchange tests (Boost.Beast, blocking).
 */

#pragma once

#include "core/net/http_headers.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace restkit::testing {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using BeastRequest = http::request<http::string_body>;
using BeastResponse = http::response<http::string_body>;

struct RecordedRequest {
    std::string method;
    std::string target;
    nethttp::Headers headers;
    std::string body;
};

/**
 * @class TestHttpServer
 * @brief Serves each connection on its own thread and records every request
 *
 * The handler fills in a 200 response prepared by the server. Content-Length
 * is derived from the body unless the handler set it. Responses to HEAD keep
 * their Content-Length but are sent without the body.
 */
class TestHttpServer {
public:
    using Handler = std::function<void(const BeastRequest&, BeastResponse&)>;

    explicit TestHttpServer(Handler handler);
    ~TestHttpServer();

    TestHttpServer(const TestHttpServer&) = delete;
    TestHttpServer& operator=(const TestHttpServer&) = delete;

    unsigned short port() const { return port_; }
    std::string url(std::string_view target = "/") const;

    std::vector<RecordedRequest> requests() const;
    std::size_t request_count() const;

    void stop();

    // Port that was free a moment ago; nothing listens on it.
    static unsigned short unused_port();

private:
    void accept_loop();
    void serve(std::shared_ptr<tcp::socket> socket);
    void record(const BeastRequest& req);

    Handler handler_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;

    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<tcp::socket>> sockets_;
    std::vector<std::thread> sessions_;
    std::vector<RecordedRequest> requests_;
};

} // namespace restkit::testing

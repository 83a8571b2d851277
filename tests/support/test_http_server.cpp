/**
 * @file test_http_server.cpp
 */

#include "test_http_server.h"

#include <sys/socket.h>

namespace restkit::testing {

TestHttpServer::TestHttpServer(Handler handler)
    : handler_(std::move(handler)),
      acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread(&TestHttpServer::accept_loop, this);
}

TestHttpServer::~TestHttpServer() {
    stop();
}

std::string TestHttpServer::url(std::string_view target) const {
    return "http://127.0.0.1:" + std::to_string(port_) + std::string(target);
}

std::vector<RecordedRequest> TestHttpServer::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t TestHttpServer::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

unsigned short TestHttpServer::unused_port() {
    net::io_context ioc;
    tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return scratch.local_endpoint().port();
}

void TestHttpServer::stop() {
    if (stopping_.exchange(true)) {
        return;
    }

    // Unblock accept() with a throwaway connection.
    {
        net::io_context ioc;
        tcp::socket waker(ioc);
        beast::error_code ec;
        waker.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<std::thread> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& s : sockets_) {
            ::shutdown(s->native_handle(), SHUT_RDWR);
        }
        sessions.swap(sessions_);
    }
    for (auto& t : sessions) {
        if (t.joinable()) {
            t.join();
        }
    }

    beast::error_code ec;
    acceptor_.close(ec);
}

void TestHttpServer::accept_loop() {
    while (!stopping_.load()) {
        auto socket = std::make_shared<tcp::socket>(ioc_);
        beast::error_code ec;
        acceptor_.accept(*socket, ec);
        if (stopping_.load()) {
            break;
        }
        if (ec) {
            continue;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        sockets_.push_back(socket);
        sessions_.emplace_back(&TestHttpServer::serve, this, socket);
    }
}

void TestHttpServer::record(const BeastRequest& req) {
    RecordedRequest rec;
    rec.method = std::string(req.method_string());
    rec.target = std::string(req.target());
    rec.body = req.body();
    for (const auto& field : req) {
        rec.headers.add(std::string(field.name_string()), std::string(field.value()));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(std::move(rec));
}

void TestHttpServer::serve(std::shared_ptr<tcp::socket> socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;) {
        BeastRequest req;
        http::read(*socket, buffer, req, ec);
        if (ec) {
            break;
        }
        record(req);

        BeastResponse res{http::status::ok, req.version()};
        res.keep_alive(req.keep_alive());
        handler_(req, res);

        if (res.find(http::field::content_length) == res.end() && !res.chunked()) {
            res.prepare_payload();
        }
        if (req.method() == http::verb::head) {
            res.body().clear();
        }

        http::write(*socket, res, ec);
        if (ec || !res.keep_alive()) {
            break;
        }
    }

    // The socket object stays alive until stop(); only signal EOF here.
    socket->shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace restkit::testing

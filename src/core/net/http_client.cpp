/**
 * @file http_client.cpp
 */

#include "core/net/http_client.h"
#include "core/codec/json_codec.h"
#include "utils/string_utils.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <istream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace restkit::nethttp {

namespace {

constexpr int kMaxRedirects = 10;
constexpr std::size_t kMaxIdleHandles = 16;
constexpr const char* kUserAgent = "restkit/1.0";

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

class CurlGlobal {
public:
    CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void ensure_curl_global() {
    static CurlGlobal global;
}

struct ResponseCapture {
    Headers headers;
    std::string body;
    long block_status = 0;
    bool headers_complete = false;
};

size_t write_cb(char* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* capture = static_cast<ResponseCapture*>(userp);
    capture->body.append(contents, total);
    return total;
}

long parse_status_code(std::string_view status_line) {
    const auto sp = status_line.find(' ');
    if (sp == std::string_view::npos) {
        return 0;
    }
    long code = 0;
    const char* end = status_line.data() + status_line.size();
    const auto res = std::from_chars(status_line.data() + sp + 1, end, code);
    return res.ec == std::errc{} ? code : 0;
}

// Called once per header line. Interim (1xx) responses each start with a
// status line, so only the last header block survives. The block counts as
// complete only once a final (non-1xx) response has ended its headers.
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t bytes = size * nitems;
    auto* capture = static_cast<ResponseCapture*>(userp);
    std::string_view line(buffer, bytes);

    if (line.rfind("HTTP/", 0) == 0) {
        capture->headers.clear();
        capture->block_status = parse_status_code(line);
        capture->headers_complete = false;
    } else if (line == "\r\n" || line == "\n") {
        if (capture->block_status >= 200) {
            capture->headers_complete = true;
        }
    } else if (!capture->headers_complete) {
        capture->headers.add_line(line);
    }
    return bytes;
}

ExchangeResult failure(ErrorKind kind, int code, std::string message) {
    return ExchangeResult{ResponseEntity{}, ExchangeError{kind, code, std::move(message)}};
}

// Checks what ends up on the request line: a token method and a URL libcurl
// can parse.
std::optional<ExchangeError> validate_target(const std::string& url, std::string_view method) {
    if (!is_valid_method(method)) {
        return ExchangeError{ErrorKind::Construction, 0, "invalid method \"" + std::string(method) + "\""};
    }

    CurlUrl parsed(curl_url(), &curl_url_cleanup);
    if (!parsed) {
        return ExchangeError{ErrorKind::Construction, 0, "curl_url allocation failed"};
    }
    const auto uc = curl_url_set(parsed.get(), CURLUPART_URL, url.c_str(), 0);
    if (uc != CURLUE_OK) {
        return ExchangeError{ErrorKind::Construction, 0,
                             "parse \"" + url + "\": " + curl_url_strerror(uc)};
    }
    return std::nullopt;
}

std::optional<ExchangeError> build_request(const std::string& url,
                                           std::string_view method,
                                           std::istream* body,
                                           Request& out) {
    if (auto err = validate_target(url, method)) {
        return err;
    }

    out.method = std::string(method);
    out.url = url;
    out.headers.clear();
    out.body.clear();

    if (body != nullptr) {
        if (body->fail()) {
            return ExchangeError{ErrorKind::Construction, 0, "request body stream is not readable"};
        }
        out.body.assign(std::istreambuf_iterator<char>(*body), std::istreambuf_iterator<char>());
        if (body->bad()) {
            return ExchangeError{ErrorKind::Construction, 0, "failed to read request body"};
        }
    }
    return std::nullopt;
}

HeaderList make_header_list(const Request& req) {
    HeaderList list(nullptr, &curl_slist_free_all);
    auto append = [&list](const std::string& line) {
        curl_slist* next = curl_slist_append(list.get(), line.c_str());
        if (next == nullptr) {
            return false;
        }
        list.release();
        list.reset(next);
        return true;
    };

    for (const auto& [name, values] : req.headers) {
        for (const auto& value : values) {
            // "Name:" would tell libcurl to drop the header; "Name;" sends it empty.
            if (!append(value.empty() ? name + ";" : name + ": " + value)) {
                return HeaderList(nullptr, &curl_slist_free_all);
            }
        }
    }
    // Keep libcurl from adding headers the caller did not ask for.
    if (!req.headers.contains("Content-Type") && !append("Content-Type:")) {
        return HeaderList(nullptr, &curl_slist_free_all);
    }
    if (!req.headers.contains("Expect") && !append("Expect:")) {
        return HeaderList(nullptr, &curl_slist_free_all);
    }
    return list;
}

// Lowercased host of url, empty when it does not parse.
std::string url_host(const std::string& url) {
    CurlUrl parsed(curl_url(), &curl_url_cleanup);
    if (!parsed || curl_url_set(parsed.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    char* host = nullptr;
    if (curl_url_get(parsed.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK || host == nullptr) {
        return {};
    }
    std::string out(host);
    curl_free(host);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// Rewrites hop to target location. 301/302/303 turn anything but GET and
// HEAD into a GET and drop the body; 307/308 repeat method and body. The
// initial request's headers are carried over, minus credentials when the
// host changes.
void follow_redirect(Request& hop, const Request& initial, const std::string& initial_host,
                     long status, std::string location) {
    if (status != 307 && status != 308) {
        if (hop.method != method::kGet && hop.method != method::kHead) {
            hop.method = std::string(method::kGet);
        }
        hop.body.clear();
    }
    hop.url = std::move(location);
    hop.headers = initial.headers;
    if (url_host(hop.url) != initial_host) {
        for (const char* name : {"Authorization", "Www-Authenticate", "Cookie", "Cookie2"}) {
            hop.headers.erase(name);
        }
    }
}

struct HopOutcome {
    long status = 0;
    std::string location; // absolute redirect target, empty when none
};

// One request/response round trip on curl, no redirect following.
std::optional<ExchangeError> perform_hop(CURL* curl,
                                         CURLSH* share,
                                         const ClientConfig& config,
                                         const Request& hop,
                                         const CallDeadline& deadline,
                                         ResponseCapture& capture,
                                         HopOutcome& outcome) {
    HeaderList headers = make_header_list(hop);
    if (!headers) {
        return ExchangeError{ErrorKind::Transport, static_cast<int>(CURLE_OUT_OF_MEMORY),
                             "failed to build header list"};
    }

    std::array<char, CURL_ERROR_SIZE> error_buf{};

    // The easy handle keeps its connection cache across a reset.
    curl_easy_reset(curl);

    CURLcode rc = CURLE_OK;
    auto setopt = [&](CURLoption option, auto value) {
        if (rc == CURLE_OK) {
            rc = curl_easy_setopt(curl, option, value);
        }
    };

    // Remaining budget, not the configured timeout: the callback and earlier
    // redirect hops may have used part of it already.
    const long timeout_ms = std::max<long>(1L, static_cast<long>(deadline.remaining().count()));

    setopt(CURLOPT_URL, hop.url.c_str());
    setopt(CURLOPT_SHARE, share);
    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_ERRORBUFFER, error_buf.data());
    setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout.count()));
    setopt(CURLOPT_TIMEOUT_MS, timeout_ms);
    setopt(CURLOPT_ACCEPT_ENCODING, "");
    setopt(CURLOPT_USERAGENT, kUserAgent);
    setopt(CURLOPT_HTTPHEADER, headers.get());
    setopt(CURLOPT_HEADERFUNCTION, &header_cb);
    setopt(CURLOPT_HEADERDATA, static_cast<void*>(&capture));
    setopt(CURLOPT_WRITEFUNCTION, &write_cb);
    setopt(CURLOPT_WRITEDATA, static_cast<void*>(&capture));

    const bool sends_body = !hop.body.empty() || hop.method == method::kPost ||
                            hop.method == method::kPut || hop.method == method::kPatch;
    if (hop.method == method::kHead) {
        setopt(CURLOPT_NOBODY, 1L);
    } else if (hop.method == method::kGet && hop.body.empty()) {
        setopt(CURLOPT_HTTPGET, 1L);
    } else {
        if (sends_body) {
            setopt(CURLOPT_POSTFIELDS, hop.body.data());
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(hop.body.size()));
        }
        if (hop.method != method::kPost) {
            setopt(CURLOPT_CUSTOMREQUEST, hop.method.c_str());
        }
    }

    if (rc != CURLE_OK) {
        return ExchangeError{ErrorKind::Transport, static_cast<int>(rc),
                             std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc)};
    }

    rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        // A body that breaks off after the final header block is a read
        // failure; a deadline hit anywhere stays a transport failure.
        const ErrorKind kind = (capture.headers_complete && rc != CURLE_OPERATION_TIMEDOUT)
                                   ? ErrorKind::BodyRead
                                   : ErrorKind::Transport;
        std::string message = error_buf[0] != '\0' ? std::string(error_buf.data()) : curl_easy_strerror(rc);
        return ExchangeError{kind, static_cast<int>(rc), std::move(message)};
    }

    rc = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &outcome.status);
    if (rc != CURLE_OK) {
        return ExchangeError{ErrorKind::Transport, static_cast<int>(rc),
                             std::string("curl_easy_getinfo failed: ") + curl_easy_strerror(rc)};
    }
    char* location = nullptr;
    if (is_redirect(outcome.status) &&
        curl_easy_getinfo(curl, CURLINFO_REDIRECT_URL, &location) == CURLE_OK && location != nullptr) {
        outcome.location = location;
    }
    return std::nullopt;
}

} // namespace

// Idle easy handles keep their connection caches, so handing them back to
// the pool is what gives keep-alive reuse. DNS and TLS sessions are shared
// through the share handle. Connection caches are not shared that way:
// libcurl does not support it across concurrent threads.
struct HttpExchangeClient::Transport {
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    std::mutex pool_mutex;
    std::vector<CURL*> idle;

    Transport() {
        ensure_curl_global();
        share = curl_share_init();
        if (share == nullptr) {
            throw std::runtime_error("curl_share_init failed");
        }
        CURLSHcode rc = curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &Transport::lock);
        if (rc == CURLSHE_OK) rc = curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &Transport::unlock);
        if (rc == CURLSHE_OK) rc = curl_share_setopt(share, CURLSHOPT_USERDATA, this);
        if (rc == CURLSHE_OK) rc = curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        if (rc == CURLSHE_OK) rc = curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        if (rc != CURLSHE_OK) {
            curl_share_cleanup(share);
            throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(rc));
        }
    }

    ~Transport() {
        // Easy handles must go before the share handle they point at.
        for (CURL* h : idle) {
            curl_easy_cleanup(h);
        }
        curl_share_cleanup(share);
    }

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    CurlHandle acquire() {
        {
            std::lock_guard<std::mutex> guard(pool_mutex);
            if (!idle.empty()) {
                CURL* h = idle.back();
                idle.pop_back();
                curl_easy_reset(h);
                return CurlHandle(h, &curl_easy_cleanup);
            }
        }
        return CurlHandle(curl_easy_init(), &curl_easy_cleanup);
    }

    void release(CurlHandle handle) {
        if (!handle) {
            return;
        }
        std::lock_guard<std::mutex> guard(pool_mutex);
        if (idle.size() < kMaxIdleHandles) {
            idle.push_back(handle.release());
        }
    }

    // Returns the easy handle to the pool on every exit path of dispatch().
    class Lease {
    public:
        explicit Lease(Transport& transport) : transport_(transport), handle_(transport.acquire()) {}
        ~Lease() { transport_.release(std::move(handle_)); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        CURL* get() const { return handle_.get(); }
        explicit operator bool() const { return static_cast<bool>(handle_); }

    private:
        Transport& transport_;
        CurlHandle handle_;
    };

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Transport*>(userptr)->locks[static_cast<size_t>(data)].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Transport*>(userptr)->locks[static_cast<size_t>(data)].unlock();
    }
};

CallDeadline::CallDeadline(std::chrono::milliseconds budget)
    : deadline_(std::chrono::steady_clock::now() + budget) {}

std::chrono::milliseconds CallDeadline::remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

bool CallDeadline::expired() const {
    return std::chrono::steady_clock::now() >= deadline_;
}

HttpExchangeClient::HttpExchangeClient() : HttpExchangeClient(ClientConfig::defaults()) {}

HttpExchangeClient::HttpExchangeClient(ClientConfig config)
    : config_(config), transport_(std::make_unique<Transport>()) {}

HttpExchangeClient::~HttpExchangeClient() = default;

ExchangeResult HttpExchangeClient::exchange(const std::string& url,
                                            std::string_view method,
                                            std::istream* body,
                                            const RequestCallback& callback) const {
    const CallDeadline deadline(config_.request_timeout);
    const auto started = std::chrono::steady_clock::now();

    Request req;
    if (auto err = build_request(url, method, body, req)) {
        spdlog::debug("[HTTP] {} {} rejected: {}", method, url, err->message);
        return ExchangeResult{ResponseEntity{}, std::move(err)};
    }

    if (callback) {
        callback(req);
        // The callback may have rewritten the request line.
        if (auto err = validate_target(req.url, req.method)) {
            spdlog::debug("[HTTP] {} {} rejected after callback: {}", req.method, req.url, err->message);
            return ExchangeResult{ResponseEntity{}, std::move(err)};
        }
    }

    ExchangeResult result = dispatch(req, deadline);

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (result.error) {
        spdlog::debug("[HTTP] {} {} failed after {} ms: {}", req.method, req.url, elapsed_ms,
                      result.error->describe());
    } else {
        spdlog::debug("[HTTP] {} {} -> {} bytes={} elapsed_ms={}", req.method, req.url,
                      result.entity.status_code, result.entity.body.size(), elapsed_ms);
    }
    return result;
}

ExchangeResult HttpExchangeClient::dispatch(const Request& req, const CallDeadline& deadline) const {
    if (deadline.expired()) {
        return failure(ErrorKind::Transport, static_cast<int>(CURLE_OPERATION_TIMEDOUT),
                       "deadline exceeded before the request was sent");
    }

    Transport::Lease curl(*transport_);
    if (!curl) {
        return failure(ErrorKind::Transport, static_cast<int>(CURLE_FAILED_INIT), "curl_easy_init failed");
    }

    const std::string initial_host = url_host(req.url);
    Request hop = req;
    for (int redirects = 0;; ++redirects) {
        if (redirects > 0 && deadline.expired()) {
            return failure(ErrorKind::Transport, static_cast<int>(CURLE_OPERATION_TIMEDOUT),
                           "deadline exceeded while following redirects");
        }

        ResponseCapture capture;
        HopOutcome outcome;
        if (auto err = perform_hop(curl.get(), transport_->share, config_, hop, deadline, capture, outcome)) {
            return ExchangeResult{ResponseEntity{}, std::move(err)};
        }

        if (outcome.location.empty()) {
            ExchangeResult result;
            result.entity.status_code = outcome.status;
            result.entity.headers = std::move(capture.headers);
            result.entity.body = std::move(capture.body);
            return result;
        }
        if (redirects == kMaxRedirects) {
            return failure(ErrorKind::Transport, static_cast<int>(CURLE_TOO_MANY_REDIRECTS),
                           "stopped after " + std::to_string(kMaxRedirects) + " redirects");
        }

        spdlog::debug("[HTTP] {} {} -> {} redirect to {}", hop.method, hop.url, outcome.status, outcome.location);
        follow_redirect(hop, req, initial_host, outcome.status, std::move(outcome.location));
    }
}

ExchangeResult HttpExchangeClient::get(const std::string& url) const {
    return exchange(url, method::kGet, nullptr, codec::json_request_callback);
}

HeadResult HttpExchangeClient::head(const std::string& url) const {
    auto result = exchange(url, method::kHead, nullptr, codec::json_request_callback);
    return HeadResult{std::move(result.entity.headers), std::move(result.error)};
}

ExchangeResult HttpExchangeClient::post(const std::string& url, std::istream& body) const {
    return exchange(url, method::kPost, &body, codec::json_request_callback);
}

ExchangeResult HttpExchangeClient::put(const std::string& url, std::istream& body) const {
    return exchange(url, method::kPut, &body, codec::json_request_callback);
}

ExchangeResult HttpExchangeClient::patch(const std::string& url, std::istream& body) const {
    return exchange(url, method::kPatch, &body, codec::json_request_callback);
}

std::optional<ExchangeError> HttpExchangeClient::del(const std::string& url) const {
    return exchange(url, method::kDelete, nullptr, codec::json_request_callback).error;
}

AllowResult HttpExchangeClient::options_for_allow(const std::string& url) const {
    auto result = exchange(url, method::kOptions, nullptr, codec::json_request_callback);
    const std::string allow = result.entity.headers.get("Allow");
    if (!allow.empty()) {
        return AllowResult{utils::split_raw(allow, ','), std::move(result.error)};
    }
    return AllowResult{{}, std::move(result.error)};
}

} // namespace restkit::nethttp

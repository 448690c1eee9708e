#pragma once

#include <azmcp/http/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace azmcp {

// ---------------------------------------------------------------------------
// HttpClientOptions — per-request limits for the HTTP client.
//
// timeout is applied to connect, read and write separately; it is the
// deadline of a single attempt.
// ---------------------------------------------------------------------------
struct HttpClientOptions {
    std::chrono::milliseconds timeout{10000};
    bool disable_tls_verify = false;
    std::string user_agent = "azmcp";
};

// ---------------------------------------------------------------------------
// HttpClient — concrete IHttpClient implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. The Impl
// struct is defined in the .cpp file.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    /// origin is "scheme://host[:port]" (see ApiUrl::Origin()).
    explicit HttpClient(const std::string& origin,
                        const HttpClientOptions& options = {});

    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpQuery& query = {},
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace azmcp

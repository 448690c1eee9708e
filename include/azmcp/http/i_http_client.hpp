#pragma once

#include <azmcp/core/error.hpp>

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace azmcp {

// ---------------------------------------------------------------------------
// HttpHeaders — key-value pairs for HTTP headers. Header names are
// case-sensitive in this representation; callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpQuery — ordered query parameters, encoded by the client.
// ---------------------------------------------------------------------------
using HttpQuery = std::vector<std::pair<std::string, std::string>>;

// ---------------------------------------------------------------------------
// HttpResponse — the result of an HTTP request that reached the server.
// Any status code may appear here; classification is the caller's job.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

// ---------------------------------------------------------------------------
// IHttpClient — abstract read-only HTTP client bound to one origin.
//
// Get returns Err only for transport failures (connection refused, DNS,
// timeout, TLS). A response with any status code is Ok.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Non-copyable, non-movable (polymorphic base).
    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpQuery& query = {},
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpClient() = default;
};

} // namespace azmcp

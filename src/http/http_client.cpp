#include <azmcp/http/http_client.hpp>

#include <azmcp/core/log.hpp>
#include <azmcp/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace azmcp {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "set-cookie" || lower_key == "ocp-apim-subscription-key";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string origin;
    HttpClientOptions options;

    Impl(const std::string& origin_value, const HttpClientOptions& opts)
        : origin(origin_value), options(opts) {
        client = std::make_unique<httplib::Client>(origin);
        client->set_connection_timeout(opts.timeout);
        client->set_read_timeout(opts.timeout);
        client->set_write_timeout(opts.timeout);
        // Query strings are percent-encoded by BuildQueryString already.
        client->set_url_encode(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (opts.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
    }

    httplib::Headers BuildRequestHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        hdrs.emplace("Accept", "application/json");
        hdrs.emplace("User-Agent", options.user_agent);
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    static void LogRequestHeaders(const httplib::Headers& hdrs) {
        for (const auto& [k, v] : hdrs) {
            LogDebug("http", "  > " + k + ": " +
                                 (IsSensitiveHeader(k) ? std::string("<redacted>") : v));
        }
    }

    static void LogResponse(int status, const std::string& body) {
        LogInfo("http", "  < " + std::to_string(status));
        if (status >= 400 && !body.empty()) {
            constexpr size_t kMaxBodyLog = 2000;
            if (body.size() <= kMaxBodyLog) {
                LogDebug("http", "  < body: " + body);
            } else {
                LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) +
                                     "... (truncated)");
            }
        }
    }
};

HttpClient::HttpClient(const std::string& origin,
                       const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(origin, options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Get(std::string_view path,
                                            const HttpQuery& query,
                                            const HttpHeaders& headers) {
    std::string target(path);
    if (!query.empty()) {
        target += (target.find('?') == std::string::npos) ? '?' : '&';
        target += BuildQueryString(query);
    }

    auto hdrs = impl_->BuildRequestHeaders(headers);
    LogInfo("http", "GET " + impl_->origin + target);
    Impl::LogRequestHeaders(hdrs);

    auto res = impl_->client->Get(target, hdrs);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "HttpGet", std::string(path), std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            std::nullopt, CategoryFromHttpTransportError(http_error)});
    }

    Impl::LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace azmcp

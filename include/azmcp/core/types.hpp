#pragma once

#include <azmcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace azmcp {

// ---------------------------------------------------------------------------
// ApiUrl — validated absolute http(s) URL of an upstream REST endpoint.
//
// Rules:
//   - Scheme must be "http" or "https" (case-insensitive)
//   - Host must be non-empty; an explicit port must be 1..65535
//   - No query string or fragment (query parameters are added per request)
//   - Path defaults to "/" when absent
//
// Origin() is "scheme://host[:port]" as accepted by the HTTP client
// constructor; Path() is the request path on that origin.
// ---------------------------------------------------------------------------
class ApiUrl {
public:
    static Result<ApiUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Origin() const noexcept { return origin_; }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] bool IsHttps() const noexcept { return https_; }

    bool operator==(const ApiUrl& other) const { return value_ == other.value_; }
    bool operator!=(const ApiUrl& other) const { return value_ != other.value_; }

private:
    ApiUrl(std::string value, std::string origin, std::string path, bool https)
        : value_(std::move(value)), origin_(std::move(origin)),
          path_(std::move(path)), https_(https) {}

    std::string value_;
    std::string origin_;
    std::string path_;
    bool https_;
};

// ---------------------------------------------------------------------------
// SkuName — validated SKU search term for the retail prices API.
// Leading and trailing whitespace is trimmed; the trimmed value must be
// non-empty. The original (untrimmed) length must not exceed kMaxLength.
// ---------------------------------------------------------------------------
class SkuName {
public:
    static constexpr size_t kMaxLength = 200;

    static Result<SkuName, std::string> Create(std::string_view sku);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const SkuName& other) const { return value_ == other.value_; }
    bool operator!=(const SkuName& other) const { return value_ != other.value_; }

private:
    explicit SkuName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

/// Trim ASCII whitespace from both ends.
std::string_view TrimWhitespace(std::string_view s);

} // namespace azmcp

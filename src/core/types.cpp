#include <azmcp/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace azmcp {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsAllDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

} // anonymous namespace

std::string_view TrimWhitespace(std::string_view s) {
    while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
    return s;
}

// ---------------------------------------------------------------------------
// ApiUrl
// ---------------------------------------------------------------------------
Result<ApiUrl, std::string> ApiUrl::Create(std::string_view url) {
    using R = Result<ApiUrl, std::string>;

    auto trimmed = TrimWhitespace(url);
    if (trimmed.empty()) {
        return R::Err("API URL must not be empty");
    }

    auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string_view::npos) {
        return R::Err("API URL must start with http:// or https://");
    }
    auto scheme = ToLower(trimmed.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return R::Err("API URL scheme must be http or https, got '" + scheme + "'");
    }

    auto rest = trimmed.substr(scheme_end + 3);
    if (rest.find_first_of("?#") != std::string_view::npos) {
        return R::Err("API URL must not contain a query string or fragment");
    }

    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    std::string path = path_start == std::string_view::npos
                           ? std::string("/")
                           : std::string(rest.substr(path_start));

    if (authority.empty()) {
        return R::Err("API URL must contain a host");
    }
    if (authority.find('@') != std::string_view::npos) {
        return R::Err("API URL must not contain credentials");
    }

    auto host = authority;
    auto colon = authority.rfind(':');
    // Bracketed IPv6 literals contain colons; only treat a colon after the
    // closing bracket as a port separator.
    auto bracket = authority.rfind(']');
    if (colon != std::string_view::npos &&
        (bracket == std::string_view::npos || colon > bracket)) {
        auto port = authority.substr(colon + 1);
        if (!IsAllDigits(port) || port.size() > 5 ||
            std::stoi(std::string(port)) == 0 ||
            std::stoi(std::string(port)) > 65535) {
            return R::Err("API URL has an invalid port: '" + std::string(port) + "'");
        }
        host = authority.substr(0, colon);
    }
    if (host.empty()) {
        return R::Err("API URL must contain a host");
    }

    auto origin = scheme + "://" + std::string(authority);
    return R::Ok(ApiUrl(origin + path, origin, path, scheme == "https"));
}

// ---------------------------------------------------------------------------
// SkuName
// ---------------------------------------------------------------------------
Result<SkuName, std::string> SkuName::Create(std::string_view sku) {
    if (sku.size() > kMaxLength) {
        return Result<SkuName, std::string>::Err(
            "sku is too long (max " + std::to_string(kMaxLength) +
            " characters, got " + std::to_string(sku.size()) + ")");
    }
    auto trimmed = TrimWhitespace(sku);
    if (trimmed.empty()) {
        return Result<SkuName, std::string>::Err("sku must be a non-empty string");
    }
    return Result<SkuName, std::string>::Ok(SkuName(std::string(trimmed)));
}

} // namespace azmcp

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace azmcp {

/// RFC 3986 percent-encoding: A-Z a-z 0-9 - _ . ~ pass through, every other
/// byte becomes %XX with uppercase hex.
std::string UrlEncode(std::string_view value);

/// "k1=v1&k2=v2" in the given order, both sides percent-encoded.
std::string BuildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params);

} // namespace azmcp

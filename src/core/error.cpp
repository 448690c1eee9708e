#include <azmcp/core/error.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace azmcp {

namespace {

constexpr size_t kMaxDetailLength = 300;

std::optional<std::string> StringField(const nlohmann::json& obj,
                                       const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

// Pull a human-readable message out of an upstream JSON error body.
// Azure APIs use several shapes depending on the gateway that rejected
// the request:
//   {"Error": {"Code": "...", "Message": "..."}}
//   {"error": {"code": "...", "message": "..."}}
//   {"message": "..."}
std::optional<std::string> ExtractUpstreamMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    for (const char* outer : {"Error", "error"}) {
        auto it = parsed.find(outer);
        if (it == parsed.end()) continue;
        if (it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
        if (it->is_object()) {
            if (auto msg = StringField(*it, "Message")) return msg;
            if (auto msg = StringField(*it, "message")) return msg;
        }
    }
    if (auto msg = StringField(parsed, "Message")) return msg;
    return StringField(parsed, "message");
}

} // anonymous namespace

const char* ErrorCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Connection:      return "connection";
        case ErrorCategory::Timeout:         return "timeout";
        case ErrorCategory::HttpStatus:      return "http_status";
        case ErrorCategory::Decode:          return "decode";
        case ErrorCategory::InvalidArgument: return "invalid_argument";
        case ErrorCategory::Config:          return "config";
        case ErrorCategory::NotFound:        return "not_found";
        case ErrorCategory::Internal:        return "internal";
    }
    return "internal";
}

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto detail = ExtractUpstreamMessage(response_body);
    if (detail.has_value() && detail->size() > kMaxDetailLength) {
        *detail = detail->substr(0, kMaxDetailLength) + "...";
    }

    ErrorCategory category = ErrorCategory::HttpStatus;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
        case 403:
            message = "Upstream rejected the request (HTTP " +
                      std::to_string(status_code) + ")";
            break;
        case 404:
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            message = "Too many requests";
            break;
        case 500:
            message = "Upstream internal error";
            break;
        case 502:
        case 503:
        case 504:
            message = "Upstream unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, detail, category};
}

int Error::ExitCode() const noexcept {
    return category == ErrorCategory::Config ||
                   category == ErrorCategory::InvalidArgument
               ? 2
               : 1;
}

bool Error::operator==(const Error& other) const {
    return category == other.category && operation == other.operation &&
           endpoint == other.endpoint && http_status == other.http_status &&
           message == other.message && detail == other.detail;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << ": " << *detail;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = ErrorCategoryName(category);
    j["operation"] = operation;
    if (!endpoint.empty()) {
        j["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        j["http_status"] = *http_status;
    }
    j["message"] = message;
    if (detail.has_value() && !detail->empty()) {
        j["detail"] = *detail;
    }
    j["exit_code"] = ExitCode();
    return nlohmann::json{{"error", j}}.dump();
}

} // namespace azmcp

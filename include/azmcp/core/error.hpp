#pragma once

#include <azmcp/core/result.hpp>

#include <optional>
#include <ostream>
#include <string>

namespace azmcp {

// ---------------------------------------------------------------------------
// ErrorCategory — drives retry decisions and process exit codes.
//
// Connection, Timeout and HttpStatus are transport failures: the request did
// not produce a usable 2xx response and may succeed if repeated. Decode means
// the upstream answered 2xx with a body that is not valid JSON.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Connection,
    Timeout,
    HttpStatus,
    Decode,
    InvalidArgument,
    Config,
    NotFound,
    Internal,
};

/// "connection", "timeout", "http_status", ...
const char* ErrorCategoryName(ErrorCategory category) noexcept;

// ---------------------------------------------------------------------------
// Error — failure of an upstream call, a config layer or a tool.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;              // e.g. "FetchJson", "ConfigLoader"
    std::string endpoint;               // request path; empty when none
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> detail;  // upstream-provided error text
    ErrorCategory category = ErrorCategory::Internal;

    /// Error for a non-2xx upstream status. A JSON error body in any of the
    /// Azure gateway shapes contributes its message as detail.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] bool IsTransport() const noexcept {
        return category == ErrorCategory::Connection ||
               category == ErrorCategory::Timeout ||
               category == ErrorCategory::HttpStatus;
    }

    /// 2 for usage and config problems, 1 for everything else.
    [[nodiscard]] int ExitCode() const noexcept;

    /// operation [endpoint] (HTTP n): message: detail
    [[nodiscard]] std::string ToString() const;

    /// {"error": {"category", "operation", ..., "exit_code"}}
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const;
    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace azmcp

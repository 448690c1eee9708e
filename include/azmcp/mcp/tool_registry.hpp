#pragma once

#include <azmcp/core/error.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace azmcp {

// ---------------------------------------------------------------------------
// ToolSpec — name, description and JSON Schema of a tool's arguments.
// ---------------------------------------------------------------------------
struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolError — failure reported by a tool handler.
//
//   InvalidParams   a required argument is missing, or quantity is not an
//                   integer (JSON-RPC -32602)
//   Failed          anything else the tool rejects or fails on, e.g. a
//                   blank sku or exhausted upstream retries (JSON-RPC -32000)
// ---------------------------------------------------------------------------
enum class ToolErrorKind {
    InvalidParams,
    Failed,
};

struct ToolError {
    ToolErrorKind kind = ToolErrorKind::Failed;
    std::string message;

    static ToolError InvalidParams(std::string message) {
        return ToolError{ToolErrorKind::InvalidParams, std::move(message)};
    }
    static ToolError Failed(std::string message) {
        return ToolError{ToolErrorKind::Failed, std::move(message)};
    }
};

using ToolOutcome = Result<nlohmann::json, ToolError>;

// A tool handler takes the call's "arguments" object and returns the JSON
// value placed verbatim in the response "result". Handlers may also throw;
// the dispatcher reports exceptions as server errors.
using ToolHandler = std::function<ToolOutcome(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — ordered registry of tools, filled once at startup.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Throws std::logic_error when name is empty or already registered.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    /// Registered tools in registration order.
    [[nodiscard]] const std::vector<ToolSpec>& Tools() const noexcept {
        return specs_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Handler for name, or nullptr when no such tool exists.
    [[nodiscard]] const ToolHandler* Find(const std::string& name) const;

    /// Schema for name, or nullptr when no such tool exists.
    [[nodiscard]] const ToolSpec* FindSpec(const std::string& name) const;

private:
    std::vector<ToolSpec> specs_;
    std::map<std::string, ToolHandler> handlers_;
};

/// First name in schema["required"] that is absent from arguments, null, or
/// an empty string. Returns nullopt when every required argument is usable.
std::optional<std::string> MissingRequiredArgument(
    const nlohmann::json& input_schema, const nlohmann::json& arguments);

} // namespace azmcp

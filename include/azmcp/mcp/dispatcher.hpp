#pragma once

#include <azmcp/mcp/tool_registry.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace azmcp {

// JSON-RPC error codes produced by the dispatcher.
namespace rpc_error {
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerError = -32000;
} // namespace rpc_error

inline constexpr const char* kProtocolVersion = "2024-11-05";

struct ServerIdentity {
    std::string name;
    std::string version;
};

// ---------------------------------------------------------------------------
// Dispatcher — routes one decoded JSON-RPC message to a response.
//
// Methods:
//   - initialize   server identity and capabilities
//   - ping         liveness, {"status":"ok","service":<name>}
//   - tools/list   registered tools in registration order
//   - tools/call   invoke a tool by params.name with params.arguments
//
// Messages without an id (or with a null id) are notifications and never
// produce a response. Tool failures become error responses; nothing a
// handler does terminates the caller.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(ToolRegistry registry, ServerIdentity identity);

    /// Response for message, or nullopt when no response must be sent.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) const;

    [[nodiscard]] const ToolRegistry& Registry() const noexcept {
        return registry_;
    }
    [[nodiscard]] const ServerIdentity& Identity() const noexcept {
        return identity_;
    }

    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

private:
    nlohmann::json Route(const std::string& method,
                         const nlohmann::json& message,
                         const nlohmann::json& id) const;
    nlohmann::json HandleInitialize(const nlohmann::json& id) const;
    nlohmann::json HandlePing(const nlohmann::json& id) const;
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& message,
                                   const nlohmann::json& id) const;

    ToolRegistry registry_;
    ServerIdentity identity_;
};

} // namespace azmcp

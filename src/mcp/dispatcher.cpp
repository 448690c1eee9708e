#include <azmcp/mcp/dispatcher.hpp>

#include <azmcp/core/log.hpp>

#include <exception>
#include <string>

namespace azmcp {

Dispatcher::Dispatcher(ToolRegistry registry, ServerIdentity identity)
    : registry_(std::move(registry)), identity_(std::move(identity)) {}

std::optional<nlohmann::json> Dispatcher::HandleMessage(
    const nlohmann::json& message) const {
    if (!message.is_object()) {
        LogDebug("mcp", "Ignoring non-object message");
        return std::nullopt;
    }
    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        LogDebug("mcp", "Ignoring message without a method");
        return std::nullopt;
    }
    const auto method = method_it->get<std::string>();

    auto id_it = message.find("id");
    if (id_it == message.end() || id_it->is_null()) {
        LogDebug("mcp", "Notification: " + method);
        return std::nullopt;
    }
    const auto& id = *id_it;

    try {
        return Route(method, message, id);
    } catch (const std::exception& e) {
        LogError("mcp", "Internal error handling " + method + ": " + e.what());
        return MakeError(id, rpc_error::kInternalError,
                         std::string("Internal error: ") + e.what());
    } catch (...) {
        LogError("mcp", "Internal error handling " + method + ": unknown exception");
        return MakeError(id, rpc_error::kInternalError,
                         "Internal error: unknown exception");
    }
}

nlohmann::json Dispatcher::Route(const std::string& method,
                                 const nlohmann::json& message,
                                 const nlohmann::json& id) const {
    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "ping") {
        return HandlePing(id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(message, id);
    }
    return MakeError(id, rpc_error::kMethodNotFound,
                     "Unknown method: " + method);
}

nlohmann::json Dispatcher::HandleInitialize(const nlohmann::json& id) const {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {{"tools", nlohmann::json::object()}};
    result["serverInfo"] = {{"name", identity_.name},
                            {"version", identity_.version}};
    return MakeResult(id, result);
}

nlohmann::json Dispatcher::HandlePing(const nlohmann::json& id) const {
    return MakeResult(id, {{"status", "ok"}, {"service", identity_.name}});
}

nlohmann::json Dispatcher::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& spec : registry_.Tools()) {
        tools.push_back({{"name", spec.name},
                         {"description", spec.description},
                         {"inputSchema", spec.input_schema}});
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json Dispatcher::HandleToolsCall(const nlohmann::json& message,
                                           const nlohmann::json& id) const {
    nlohmann::json params = nlohmann::json::object();
    if (auto it = message.find("params"); it != message.end() && !it->is_null()) {
        if (!it->is_object()) {
            return MakeError(id, rpc_error::kInvalidParams,
                             "params must be an object");
        }
        params = *it;
    }

    std::string name;
    if (auto it = params.find("name"); it != params.end() && it->is_string()) {
        name = it->get<std::string>();
    }
    const auto* handler = name.empty() ? nullptr : registry_.Find(name);
    const auto* spec = name.empty() ? nullptr : registry_.FindSpec(name);
    if (handler == nullptr || spec == nullptr) {
        return MakeError(id, rpc_error::kMethodNotFound, "Unknown tool: " + name);
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto it = params.find("arguments");
        it != params.end() && !it->is_null()) {
        if (!it->is_object()) {
            return MakeError(id, rpc_error::kInvalidParams,
                             "arguments must be an object");
        }
        arguments = *it;
    }

    if (auto missing = MissingRequiredArgument(spec->input_schema, arguments)) {
        return MakeError(id, rpc_error::kInvalidParams,
                         "Missing required argument: " + *missing);
    }

    LogInfo("mcp", "tools/call " + name);
    try {
        auto outcome = (*handler)(arguments);
        if (outcome.IsOk()) {
            return MakeResult(id, outcome.Value());
        }
        const auto& error = outcome.Error();
        if (error.kind == ToolErrorKind::InvalidParams) {
            return MakeError(id, rpc_error::kInvalidParams, error.message);
        }
        LogWarn("mcp", name + " failed: " + error.message);
        return MakeError(id, rpc_error::kServerError,
                         "Server error: " + error.message);
    } catch (const std::exception& e) {
        LogWarn("mcp", name + " threw: " + e.what());
        return MakeError(id, rpc_error::kServerError,
                         std::string("Server error: ") + e.what());
    } catch (...) {
        LogWarn("mcp", name + " threw a non-standard exception");
        return MakeError(id, rpc_error::kServerError,
                         "Server error: unknown exception");
    }
}

nlohmann::json Dispatcher::MakeError(const nlohmann::json& id, int code,
                                     const std::string& message) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json Dispatcher::MakeResult(const nlohmann::json& id,
                                      const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

} // namespace azmcp

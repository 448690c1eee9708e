#include <azmcp/mcp/tool_registry.hpp>

#include <stdexcept>

namespace azmcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (name.empty()) {
        throw std::logic_error("Tool name must not be empty");
    }
    if (handlers_.count(name) > 0) {
        throw std::logic_error("Tool registered twice: " + name);
    }
    specs_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolHandler* ToolRegistry::Find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

const ToolSpec* ToolRegistry::FindSpec(const std::string& name) const {
    for (const auto& spec : specs_) {
        if (spec.name == name) return &spec;
    }
    return nullptr;
}

std::optional<std::string> MissingRequiredArgument(
    const nlohmann::json& input_schema, const nlohmann::json& arguments) {
    if (!input_schema.is_object()) return std::nullopt;
    auto required = input_schema.find("required");
    if (required == input_schema.end() || !required->is_array()) {
        return std::nullopt;
    }

    for (const auto& key : *required) {
        if (!key.is_string()) continue;
        const auto name = key.get<std::string>();
        auto it = arguments.find(name);
        if (it == arguments.end() || it->is_null() ||
            (it->is_string() && it->get<std::string>().empty())) {
            return name;
        }
    }
    return std::nullopt;
}

} // namespace azmcp

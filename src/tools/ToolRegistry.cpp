#include "ToolRegistry.hpp"
#include "core/Errors.hpp"
#include <stdexcept>

namespace mcpx {

void validate_required_properties(const json& input, const json& schema) {
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("type") && schema["type"] == "object" && !input.is_object()) {
        throw ValidationError("Input validation failed: expected an object");
    }
    if (!schema.contains("required") || !schema["required"].is_array()) {
        return;
    }

    json missing = json::array();
    for (const auto& key : schema["required"]) {
        if (!key.is_string()) {
            continue;
        }
        if (!input.is_object() || !input.contains(key.get<std::string>())) {
            missing.push_back(key);
        }
    }

    if (!missing.empty()) {
        throw ValidationError("Input validation failed: missing required properties",
                              {{"missing", missing}});
    }
}

ToolRegistry::ToolRegistry(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler, InputValidator validator) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    if (tools_.count(info.name) > 0) {
        logger_->warn("Tool '{}' is already registered, overwriting", info.name);
    }

    tools_[info.name] = Tool{
        info,
        std::move(handler),
        validator ? std::move(validator) : InputValidator(validate_required_properties)
    };
    logger_->info("Registered tool: {}", info.name);
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    bool existed = tools_.erase(name) > 0;
    if (existed) {
        logger_->info("Unregistered tool: {}", name);
    } else {
        logger_->warn("Attempted to unregister non-existent tool: {}", name);
    }
    return existed;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

std::vector<ToolInfo> ToolRegistry::list() const {
    std::vector<ToolInfo> result;
    result.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        result.push_back(tool.info);
    }
    return result;
}

json ToolRegistry::list_json() const {
    json tools_array = json::array();

    for (const auto& [name, tool] : tools_) {
        tools_array.push_back({
            {"name", tool.info.name},
            {"description", tool.info.description},
            {"inputSchema", tool.info.input_schema}
        });
    }
    return tools_array;
}

void ToolRegistry::clear() {
    logger_->info("Clearing all registered tools");
    tools_.clear();
}

void ToolRegistry::validate(const Tool& tool, const json& input) {
    if (tool.validator) {
        tool.validator(input, tool.info.input_schema);
    }
}

} // namespace mcpx

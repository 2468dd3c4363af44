#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief Metadata for a tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Execution context handed to a tool handler
 */
struct ToolContext {
    std::string client_id;
    std::shared_ptr<spdlog::logger> logger;
    json metadata = json::object();
};

/**
 * @brief Function signature for tool execution
 * @param args JSON tool input (already validated)
 * @param context Caller and logging context
 * @return JSON result
 */
using ToolHandler = std::function<json(const json& args, const ToolContext& context)>;

/**
 * @brief Input validator; throws ValidationError to reject input
 */
using InputValidator = std::function<void(const json& input, const json& schema)>;

/**
 * @brief Default validator: input must be an object holding every "required" property
 * @throws ValidationError listing the missing properties
 */
void validate_required_properties(const json& input, const json& schema);

/**
 * @brief A registered tool
 */
struct Tool {
    ToolInfo info;
    ToolHandler handler;
    InputValidator validator;
};

/**
 * @brief Name-keyed registry of tools; the last registration of a name wins
 */
class ToolRegistry {
public:
    explicit ToolRegistry(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @param validator Input validator, validate_required_properties if empty
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler, InputValidator validator = {});

    /**
     * @return true if a tool was removed
     */
    bool unregister_tool(const std::string& name);

    bool has_tool(const std::string& name) const;

    /**
     * @brief Find a tool
     * @return Pointer valid until the next registry mutation, or nullptr
     */
    const Tool* find(const std::string& name) const;

    std::vector<ToolInfo> list() const;

    /**
     * @brief Tool metadata as returned by tools/list
     */
    json list_json() const;

    std::size_t size() const { return tools_.size(); }
    void clear();

    /**
     * @brief Run a tool's validator against input
     * @throws ValidationError on rejection
     */
    static void validate(const Tool& tool, const json& input);

private:
    std::map<std::string, Tool> tools_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcpx

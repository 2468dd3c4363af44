#pragma once

#include "tools/ToolRegistry.hpp"

namespace mcpx {

/**
 * @brief MCP tool that returns its input message
 */
class EchoTool {
public:
    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "message" parameter
     * @param context Caller context, used for logging
     * @return JSON with "original", "echoed" and an ISO-8601 "timestamp"
     * @throws ValidationError if "message" is not a string
     */
    json execute(const json& args, const ToolContext& context) const;
};

} // namespace mcpx

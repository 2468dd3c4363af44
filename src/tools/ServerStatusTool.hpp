#pragma once

#include "mcp/MCPServer.hpp"
#include "plugins/MetricsPlugin.hpp"
#include <memory>

namespace mcpx {

/**
 * @brief MCP tool reporting server status and, when available, tool metrics
 */
class ServerStatusTool {
public:
    /**
     * @brief Construct tool
     * @param server Server to report on; must outlive the tool
     * @param metrics Metrics plugin to include (may be null)
     */
    explicit ServerStatusTool(const MCPServer& server, std::shared_ptr<const MetricsPlugin> metrics = nullptr);

    static ToolInfo get_info();

    /**
     * @brief Execute tool
     * @return MCPServer::status() plus "metrics" when a metrics plugin is attached
     */
    json execute(const json& args) const;

private:
    const MCPServer& server_;
    std::shared_ptr<const MetricsPlugin> metrics_;
};

} // namespace mcpx

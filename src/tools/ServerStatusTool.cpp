#include "ServerStatusTool.hpp"

namespace mcpx {

ServerStatusTool::ServerStatusTool(const MCPServer& server, std::shared_ptr<const MetricsPlugin> metrics)
    : server_(server), metrics_(std::move(metrics)) {
}

ToolInfo ServerStatusTool::get_info() {
    return {
        "server_status",
        "Report server name, version, transport, registered tools and connected clients",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json ServerStatusTool::execute(const json&) const {
    json result = server_.status();
    if (metrics_) {
        result["metrics"] = metrics_->get_metrics();
    }
    return result;
}

} // namespace mcpx

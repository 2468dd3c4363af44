#include "LoggingPlugin.hpp"
#include "mcp/IServerHandle.hpp"

namespace mcpx {

void LoggingPlugin::initialize(IServerHandle& server) {
    auto logger = server.logger();
    logger->info("LoggingPlugin initialized");

    server.register_hook({"log-client-connect", HookPhase::OnClientConnect, [logger](const HookContext& ctx) {
        logger->info("[logging-plugin] client connected: {}", ctx.client_id.value_or("<unknown>"));
    }});

    server.register_hook({"log-client-disconnect", HookPhase::OnClientDisconnect, [logger](const HookContext& ctx) {
        logger->info("[logging-plugin] client disconnected: {}", ctx.client_id.value_or("<unknown>"));
    }});

    server.register_hook({"log-tool-errors", HookPhase::AfterToolExecution, [logger](const HookContext& ctx) {
        if (ctx.data.is_object() && ctx.data.contains("error")) {
            logger->error("[logging-plugin] tool {} failed for {}: {}",
                          ctx.tool_name.value_or("<unknown>"),
                          ctx.client_id.value_or("<unknown>"),
                          ctx.data["error"].is_string() ? ctx.data["error"].get<std::string>()
                                                        : ctx.data["error"].dump());
        }
    }});
}

} // namespace mcpx

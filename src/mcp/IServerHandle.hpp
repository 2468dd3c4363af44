#pragma once

#include "core/HookRegistry.hpp"
#include "core/MiddlewarePipeline.hpp"
#include "core/ServerConfig.hpp"
#include "mcp/ITransport.hpp"
#include "tools/ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <vector>

namespace mcpx {

/**
 * @brief The server surface exposed to plugins
 *
 * Registration of tools, middleware and hooks plus access to the active
 * transport. A plugin needs nothing else.
 */
class IServerHandle {
public:
    virtual ~IServerHandle() = default;

    virtual const ServerConfig& config() const = 0;
    virtual std::shared_ptr<spdlog::logger> logger() const = 0;

    virtual void register_tool(const ToolInfo& info, ToolHandler handler, InputValidator validator) = 0;

    /**
     * @brief Register a tool validated by validate_required_properties
     */
    void register_tool(const ToolInfo& info, ToolHandler handler) {
        register_tool(info, std::move(handler), InputValidator{});
    }

    virtual bool unregister_tool(const std::string& name) = 0;
    virtual std::vector<ToolInfo> list_tools() const = 0;

    virtual void register_middleware(Middleware middleware) = 0;
    virtual void register_hook(Hook hook) = 0;

    /**
     * @return Active transport or nullptr
     */
    virtual ITransport* transport() const = 0;

    /**
     * @brief Replace the active transport, stopping the current one first
     */
    virtual void set_transport(std::unique_ptr<ITransport> transport) = 0;
};

} // namespace mcpx

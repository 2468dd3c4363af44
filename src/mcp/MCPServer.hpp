#pragma once

#include "core/HookRegistry.hpp"
#include "core/MiddlewarePipeline.hpp"
#include "core/ServerConfig.hpp"
#include "mcp/IServerHandle.hpp"
#include "mcp/ITransport.hpp"
#include "plugins/PluginManager.hpp"
#include "tools/ToolRegistry.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief Message dispatcher and owner of all registries
 *
 * Wires transport events to the middleware pipeline, the tool registry
 * and the lifecycle hooks:
 *
 *   connect    -> onClientConnect hooks
 *   message    -> middleware chain -> terminal step (built-in method or
 *                 tool: validate, beforeToolExecution, handler,
 *                 afterToolExecution) -> correlated response
 *   disconnect -> onClientDisconnect hooks
 *
 * Errors from the chain are converted into one error envelope per message
 * (log only for messages without an id).
 *
 * Built-in methods: initialize, tools/list, tools/call (alias
 * tools/execute), notifications/initialized. Any other method is looked up
 * directly in the tool registry.
 */
class MCPServer : public IServerHandle {
public:
    /**
     * @brief Construct server
     * @param config Server identity and transport settings
     * @param transport Initial transport (may be null, see set_transport())
     * @param logger Logger (default: spdlog default logger)
     */
    explicit MCPServer(ServerConfig config = {},
                       std::unique_ptr<ITransport> transport = nullptr,
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    ~MCPServer() override;

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // IServerHandle
    const ServerConfig& config() const override { return config_; }
    std::shared_ptr<spdlog::logger> logger() const override { return logger_; }

    using IServerHandle::register_tool;
    void register_tool(const ToolInfo& info, ToolHandler handler, InputValidator validator) override;
    bool unregister_tool(const std::string& name) override;
    std::vector<ToolInfo> list_tools() const override;

    void register_middleware(Middleware middleware) override;
    void register_hook(Hook hook) override;

    ITransport* transport() const override { return transport_.get(); }

    /**
     * @brief Replace the active transport
     *
     * When running, the current transport is stopped before the new one
     * is wired and started, so two transports are never live together.
     * Swapping from inside a tool or middleware drops the reply of the
     * message being dispatched from the old transport: it is sent through
     * the new one, and is lost unless that transport knows the same client.
     *
     * @throws std::invalid_argument on null transport
     */
    void set_transport(std::unique_ptr<ITransport> transport) override;

    /**
     * @brief Register a plugin to be loaded by start()
     */
    void register_plugin(std::shared_ptr<IPlugin> plugin);

    PluginManager& plugins() { return plugins_; }
    const PluginManager& plugins() const { return plugins_; }

    const MiddlewarePipeline& middleware() const { return middleware_; }
    const HookRegistry& hooks() const { return hooks_; }
    const ToolRegistry& tools() const { return tools_; }

    /**
     * @brief Load registered plugins, fire onStart hooks, start the transport
     *
     * Warns and returns if already running. If the transport fails to
     * start, onStop hooks fire before the error propagates; plugins stay
     * loaded.
     *
     * @throws std::logic_error if no transport is set
     * @throws Plugin initialize() or transport start() failures
     */
    void start();

    /**
     * @brief Stop the transport, then fire onStop hooks
     *
     * Warns and returns if not running.
     */
    void stop();

    /**
     * @brief Start (if needed), pump the transport until its input ends, stop
     *
     * Blocks until the transport run loop returns.
     */
    void run();

    bool is_running() const { return running_; }

    /**
     * @brief Snapshot of server state
     * @return JSON with name, version, running, transport, tools, clients
     */
    json status() const;

private:
    void wire_transport();

    void handle_connect(const std::string& client_id);
    void handle_disconnect(const std::string& client_id);
    void handle_message(const std::string& client_id, const Message& message);

    /**
     * @brief Terminal step of the middleware chain
     * @return Result for the reply, or std::nullopt when nothing is returned
     */
    std::optional<json> dispatch(const Message& message, MiddlewareContext& context);

    json handle_initialize(const json& params);
    json handle_tools_list();
    json handle_tools_call(const json& params, MiddlewareContext& context);
    json execute_tool(const std::string& name, const json& input, MiddlewareContext& context, int not_found_code);

    void reply(const std::string& client_id, const Message& message);
    void reply_error(const std::string& client_id, const Message& request, const std::exception& error);

    ServerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<ITransport> transport_;
    /// Previous transport, kept alive in case it is still dispatching
    std::unique_ptr<ITransport> retired_transport_;

    MiddlewarePipeline middleware_;
    HookRegistry hooks_;
    ToolRegistry tools_;
    PluginManager plugins_;

    std::set<std::string> clients_;
    std::atomic<bool> running_{false};
    bool initialized_{false};
};

} // namespace mcpx

#include "MCPServer.hpp"
#include "core/Errors.hpp"
#include <chrono>
#include <stdexcept>

namespace mcpx {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

MCPServer::MCPServer(ServerConfig config,
                     std::unique_ptr<ITransport> transport,
                     std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      middleware_(logger_),
      hooks_(logger_),
      tools_(logger_),
      plugins_(logger_) {
    if (transport) {
        transport_ = std::move(transport);
        wire_transport();
    }
    logger_->info("MCPServer initialized: {} v{}", config_.name, config_.version);
}

MCPServer::~MCPServer() {
    if (running_) {
        stop();
    }
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler, InputValidator validator) {
    tools_.register_tool(info, std::move(handler), std::move(validator));
}

bool MCPServer::unregister_tool(const std::string& name) {
    return tools_.unregister_tool(name);
}

std::vector<ToolInfo> MCPServer::list_tools() const {
    return tools_.list();
}

void MCPServer::register_middleware(Middleware middleware) {
    middleware_.add(std::move(middleware));
}

void MCPServer::register_hook(Hook hook) {
    hooks_.add(std::move(hook));
}

void MCPServer::register_plugin(std::shared_ptr<IPlugin> plugin) {
    plugins_.register_plugin(std::move(plugin));
}

void MCPServer::set_transport(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Transport cannot be null");
    }

    if (running_ && transport_) {
        transport_->stop();
    }

    retired_transport_ = std::move(transport_);
    transport_ = std::move(transport);
    wire_transport();

    if (running_) {
        try {
            transport_->start();
        } catch (const std::exception& e) {
            logger_->error("Failed to start transport {}: {}", transport_->name(), e.what());
            running_ = false;
            throw;
        }
    }

    logger_->info("Transport set to: {}", transport_->name());
}

void MCPServer::wire_transport() {
    transport_->on_connect([this](const std::string& client_id) {
        handle_connect(client_id);
    });
    transport_->on_disconnect([this](const std::string& client_id) {
        handle_disconnect(client_id);
    });
    transport_->on_message([this](const std::string& client_id, const Message& message) {
        handle_message(client_id, message);
    });
}

void MCPServer::start() {
    if (running_) {
        logger_->warn("Server is already running");
        return;
    }
    if (!transport_) {
        throw std::logic_error("Cannot start server without a transport");
    }

    logger_->info("Starting MCP server...");

    plugins_.load_all(*this);
    hooks_.fire(HookPhase::OnStart);

    try {
        transport_->start();
    } catch (const std::exception& e) {
        logger_->error("Failed to start transport {}: {}", transport_->name(), e.what());
        hooks_.fire(HookPhase::OnStop);
        throw;
    }
    running_ = true;

    logger_->info("MCP server started on {} transport", transport_->name());
}

void MCPServer::stop() {
    if (!running_) {
        logger_->warn("Server is not running");
        return;
    }

    logger_->info("Stopping MCP server...");
    running_ = false;

    if (transport_) {
        try {
            transport_->stop();
        } catch (const std::exception& e) {
            logger_->error("Error stopping transport {}: {}", transport_->name(), e.what());
        }
    }

    hooks_.fire(HookPhase::OnStop);
    clients_.clear();
    logger_->info("MCP server stopped");
}

void MCPServer::run() {
    if (!running_) {
        start();
    }

    logger_->info("MCPServer starting main loop");
    transport_->run();

    if (running_) {
        stop();
    }
}

json MCPServer::status() const {
    return {
        {"name", config_.name},
        {"version", config_.version},
        {"running", running_.load()},
        {"transport", transport_ ? json(transport_->name()) : json()},
        {"tools", tools_.size()},
        {"clients", clients_.size()},
        {"middleware", middleware_.size()},
        {"plugins", plugins_.loaded().size()}
    };
}

void MCPServer::handle_connect(const std::string& client_id) {
    clients_.insert(client_id);
    logger_->info("Client connected: {}", client_id);

    HookContext context;
    context.client_id = client_id;
    hooks_.fire(HookPhase::OnClientConnect, context);
}

void MCPServer::handle_disconnect(const std::string& client_id) {
    clients_.erase(client_id);
    logger_->info("Client disconnected: {}", client_id);

    HookContext context;
    context.client_id = client_id;
    hooks_.fire(HookPhase::OnClientDisconnect, context);
}

void MCPServer::handle_message(const std::string& client_id, const Message& message) {
    MiddlewareContext context{client_id, logger_, json::object()};
    std::optional<json> result;
    bool dispatched = false;

    logger_->debug("Handling {} from {}: method={}", to_string(message.type), client_id,
                   message.method.value_or("<none>"));

    try {
        middleware_.run(message, context, [&]() {
            dispatched = true;
            result = dispatch(message, context);
        });
    } catch (const std::exception& e) {
        logger_->error("Error handling message (method={}): {}", message.method.value_or("<none>"), e.what());
        reply_error(client_id, message, e);
        return;
    } catch (...) {
        logger_->error("Error handling message (method={}): non-standard exception",
                       message.method.value_or("<none>"));
        reply_error(client_id, message, McpError(kInternalError, "Internal error: non-standard exception"));
        return;
    }

    if (!message.expects_reply()) {
        return;
    }
    if (!dispatched) {
        logger_->debug("Request {} was short-circuited by middleware, no reply sent", message.id->dump());
        return;
    }

    try {
        reply(client_id, Message::response(*message.id, result.value_or(json())));
    } catch (const ProtocolFramingError& e) {
        logger_->error("Response for {} cannot be framed: {}", message.id->dump(), e.what());
        reply_error(client_id, message, e);
    } catch (const std::exception& e) {
        logger_->error("Failed to send response to {}: {}", client_id, e.what());
    }
}

std::optional<json> MCPServer::dispatch(const Message& message, MiddlewareContext& context) {
    if (message.type == MessageType::Response || message.type == MessageType::Error) {
        logger_->debug("Ignoring inbound {} envelope", to_string(message.type));
        return std::nullopt;
    }

    if (!message.method || message.method->empty()) {
        throw McpError(kInvalidRequest, "Invalid Request: missing method");
    }

    const std::string& method = *message.method;
    const json params = message.params.is_null() ? json::object() : message.params;

    if (method == "initialize") {
        json result = handle_initialize(params);
        initialized_ = true;
        return result;
    }
    if (method == "notifications/initialized") {
        logger_->info("Client sent initialized notification, server is ready");
        return std::nullopt;
    }
    if (method == "tools/list") {
        return handle_tools_list();
    }
    if (method == "tools/call" || method == "tools/execute") {
        return handle_tools_call(params, context);
    }
    if (tools_.has_tool(method)) {
        return execute_tool(method, params, context, kMethodNotFound);
    }

    throw UnknownMethodError("Method not found: " + method);
}

json MCPServer::handle_initialize(const json& params) {
    logger_->info("Handling initialize request");

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        logger_->info("Client: {} version {}", client_name, client_version);
    }

    return {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", config_.name},
            {"version", config_.version}
        }}
    };
}

json MCPServer::handle_tools_list() {
    json tools_array = tools_.list_json();
    logger_->debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params, MiddlewareContext& context) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw McpError(kInvalidParams, "Missing required parameter: name");
    }

    std::string tool_name = params["name"];
    json arguments = params.contains("arguments") ? params["arguments"]
                                                  : params.value("input", json::object());

    json result = execute_tool(tool_name, arguments, context, kToolNotFound);

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.is_string() ? result.get<std::string>() : result.dump()}
            }
        })}
    };
}

json MCPServer::execute_tool(const std::string& name,
                             const json& input,
                             MiddlewareContext& context,
                             int not_found_code) {
    const Tool* registered = tools_.find(name);
    if (!registered) {
        throw UnknownMethodError("Tool not found: " + name, not_found_code);
    }
    // Hooks may re-register tools; keep our own copy for this call.
    const Tool tool = *registered;

    ToolRegistry::validate(tool, input);

    HookContext hook_context;
    hook_context.client_id = context.client_id;
    hook_context.tool_name = name;
    hook_context.data = {{"input", input}};
    hooks_.fire(HookPhase::BeforeToolExecution, hook_context);

    ToolContext tool_context{context.client_id, logger_, context.metadata};
    logger_->debug("Calling tool: {} with args: {}", name, input.dump());

    const auto started = std::chrono::steady_clock::now();
    json result;
    try {
        result = tool.handler(input, tool_context);
    } catch (const std::exception& e) {
        hook_context.data = {{"error", e.what()}, {"duration_ms", elapsed_ms(started)}};
        hooks_.fire(HookPhase::AfterToolExecution, hook_context);

        if (dynamic_cast<const McpError*>(&e) != nullptr) {
            throw;
        }
        throw McpError(kToolExecutionError, e.what());
    }

    hook_context.data = {{"result", result}, {"duration_ms", elapsed_ms(started)}};
    hooks_.fire(HookPhase::AfterToolExecution, hook_context);

    return result;
}

void MCPServer::reply(const std::string& client_id, const Message& message) {
    if (!transport_) {
        throw TransportError("No transport configured");
    }
    transport_->send(client_id, message);
}

void MCPServer::reply_error(const std::string& client_id, const Message& request, const std::exception& error) {
    if (!request.expects_reply()) {
        return;
    }

    try {
        reply(client_id, Message::error_reply(request.id, to_error_object(error)));
    } catch (const std::exception& e) {
        logger_->error("Failed to send error response to {}: {}", client_id, e.what());
    }
}

} // namespace mcpx

#include "core/ServerConfig.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/TransportFactory.hpp"
#include "middleware/RequestLoggingMiddleware.hpp"
#include "middleware/TimeoutMiddleware.hpp"
#include "plugins/LoggingPlugin.hpp"
#include "plugins/MetricsPlugin.hpp"
#include "tools/EchoTool.hpp"
#include "tools/ServerStatusTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

namespace {
    std::atomic<bool> shutdown_requested{false};
    mcpx::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
        if (name == "trace") return spdlog::level::trace;
        if (name == "debug") return spdlog::level::debug;
        if (name == "info") return spdlog::level::info;
        if (name == "warn") return spdlog::level::warn;
        if (name == "error") return spdlog::level::err;
        if (name == "critical") return spdlog::level::critical;
        return std::nullopt;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"mcpx - MCP server with middleware, hooks and plugins"};

    std::string config_path;
    app.add_option("-c,--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);

    std::string transport_name;
    app.add_option("-t,--transport", transport_name, "Transport (stdio, http, sse, websocket)");

    std::string host;
    app.add_option("--host", host, "Listen address for network transports");

    int port = 0;
    app.add_option("-p,--port", port, "Listen port for network transports")->check(CLI::Range(0, 65535));

    std::string server_name;
    app.add_option("--name", server_name, "Server name reported to clients");

    std::string log_level;
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)");

    int request_timeout_ms = 0;
    app.add_option("--request-timeout-ms", request_timeout_ms, "Reject requests slower than this (0 disables)")
        ->check(CLI::NonNegativeNumber);

    bool enable_metrics = false;
    app.add_flag("--enable-metrics", enable_metrics, "Load the metrics plugin");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    mcpx::ServerConfig config;

    if (version) {
        std::cout << config.name << " version " << config.version << std::endl;
        return 0;
    }

    // Protocol traffic owns stdout; every diagnostic goes to stderr.
    auto logger = spdlog::stderr_color_mt("mcpx");
    spdlog::set_default_logger(logger);

    try {
        if (!config_path.empty()) {
            config = mcpx::load_config_file(config_path);
        }
        if (!transport_name.empty()) {
            auto type = mcpx::transport_type_from_string(transport_name);
            if (!type) {
                throw std::invalid_argument("Unknown transport type: " + transport_name);
            }
            config.transport.type = *type;
        }
        if (!host.empty()) {
            config.transport.host = host;
        }
        if (app.count("--port") > 0) {
            config.transport.port = port;
        }
        if (!server_name.empty()) {
            config.name = server_name;
        }
        if (!log_level.empty()) {
            config.log_level = log_level;
        }
    } catch (const std::invalid_argument& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    }

    auto level = parse_log_level(config.log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << config.log_level << std::endl;
        return 1;
    }
    spdlog::set_level(*level);

    spdlog::info("Starting {} v{}", config.name, config.version);
    spdlog::info("Log level: {}", config.log_level);

    try {
        setup_signal_handlers();

        std::unique_ptr<mcpx::ITransport> transport;
        try {
            transport = mcpx::create_transport(config.transport, logger);
        } catch (const std::invalid_argument& e) {
            spdlog::critical("Configuration error: {}", e.what());
            return 1;
        }

        auto server = std::make_unique<mcpx::MCPServer>(config, std::move(transport), logger);
        global_server = server.get();

        server->register_middleware(mcpx::make_request_logging_middleware());
        if (request_timeout_ms > 0) {
            mcpx::TimeoutOptions timeout;
            timeout.timeout = std::chrono::milliseconds(request_timeout_ms);
            server->register_middleware(mcpx::make_timeout_middleware(timeout));
        }

        server->register_plugin(std::make_shared<mcpx::LoggingPlugin>());
        std::shared_ptr<mcpx::MetricsPlugin> metrics;
        if (enable_metrics) {
            metrics = std::make_shared<mcpx::MetricsPlugin>();
            server->register_plugin(metrics);
        }

        auto echo_tool = std::make_shared<mcpx::EchoTool>();
        server->register_tool(
            mcpx::EchoTool::get_info(),
            [echo_tool](const nlohmann::json& args, const mcpx::ToolContext& context) {
                return echo_tool->execute(args, context);
            }
        );

        auto status_tool = std::make_shared<mcpx::ServerStatusTool>(*server, metrics);
        server->register_tool(
            mcpx::ServerStatusTool::get_info(),
            [status_tool](const nlohmann::json& args, const mcpx::ToolContext&) {
                return status_tool->execute(args);
            }
        );

        spdlog::info("All tools registered, starting server");

        // Blocks until input ends or a signal stops the transport
        server->run();

        try {
            server->plugins().unload_all();
        } catch (const std::exception& e) {
            spdlog::error("Plugin cleanup failed: {}", e.what());
        }

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        global_server = nullptr;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

#include "core/Errors.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "middleware/RequestLoggingMiddleware.hpp"
#include "plugins/LoggingPlugin.hpp"
#include "plugins/MetricsPlugin.hpp"
#include "tools/EchoTool.hpp"
#include "tools/ServerStatusTool.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <string>
#include <vector>

using namespace mcpx;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
        logger = std::make_shared<spdlog::logger>("e2e", sink);

        ServerConfig config;
        config.name = "e2e-server";
        config.version = "0.9.0";

        auto transport = std::make_unique<StdioTransport>(input_stream, output_stream, logger);
        server = std::make_unique<MCPServer>(config, std::move(transport), logger);

        metrics = std::make_shared<MetricsPlugin>();
        server->register_middleware(make_request_logging_middleware());
        server->register_plugin(std::make_shared<LoggingPlugin>());
        server->register_plugin(metrics);

        auto echo_tool = std::make_shared<EchoTool>();
        server->register_tool(EchoTool::get_info(), [echo_tool](const json& args, const ToolContext& context) {
            return echo_tool->execute(args, context);
        });

        auto status_tool = std::make_shared<ServerStatusTool>(*server, metrics);
        server->register_tool(ServerStatusTool::get_info(), [status_tool](const json& args, const ToolContext&) {
            return status_tool->execute(args);
        });

        server->register_tool({"multiline", "Returns text spanning lines", {{"type", "object"}}},
                              [](const json&, const ToolContext&) { return json("first\nsecond"); });
    }

    void SendLine(const std::string& line) {
        input_text += line + "\n";
    }

    void SendRequest(const json& request) {
        SendLine(request.dump());
    }

    std::vector<std::string> RunAndCollectLines() {
        input_stream.str(input_text);
        server->run();

        std::vector<std::string> lines;
        std::istringstream output(output_stream.str());
        std::string line;
        while (std::getline(output, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::string input_text;
    std::istringstream input_stream;
    std::ostringstream output_stream;
    std::ostringstream log_output;
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<MetricsPlugin> metrics;
    std::unique_ptr<MCPServer> server;
};

TEST_F(EndToEndTest, FullSessionOverStdio) {
    SendRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                 {"params", {{"protocolVersion", "2024-11-05"}, {"capabilities", json::object()}}}});
    SendRequest({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                 {"params", {{"name", "echo"}, {"arguments", {{"message", "hello"}}}}}});

    auto lines = RunAndCollectLines();

    ASSERT_EQ(lines.size(), 3u);

    json init = json::parse(lines[0]);
    EXPECT_EQ(init["id"], 1);
    EXPECT_EQ(init["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "e2e-server");
    EXPECT_EQ(init["result"]["serverInfo"]["version"], "0.9.0");
    EXPECT_TRUE(init["result"]["capabilities"].contains("tools"));

    json list = json::parse(lines[1]);
    EXPECT_EQ(list["id"], 2);
    std::vector<std::string> names;
    for (const auto& tool : list["result"]["tools"]) {
        names.push_back(tool["name"].get<std::string>());
        EXPECT_TRUE(tool.contains("inputSchema"));
    }
    EXPECT_EQ(names, (std::vector<std::string>{"echo", "multiline", "server_status"}));

    json echo = json::parse(lines[2]);
    EXPECT_EQ(echo["id"], 3);
    ASSERT_EQ(echo["result"]["content"].size(), 1u);
    EXPECT_EQ(echo["result"]["content"][0]["type"], "text");
    json payload = json::parse(echo["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["original"], "hello");
    EXPECT_EQ(payload["echoed"], "hello");
    EXPECT_TRUE(payload["timestamp"].is_string());

    EXPECT_FALSE(server->is_running());
}

TEST_F(EndToEndTest, MalformedLinesDoNotStopTheSession) {
    SendLine(R"({"jsonrpc":"2.0","id":"9","method":"tools/list",)");
    SendLine("not json at all");
    SendRequest({{"jsonrpc", "2.0"}, {"id", 10}, {"method", "tools/list"}});

    auto lines = RunAndCollectLines();

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], R"({"id":"9","error":{"code":-32700,"message":"Parse error"}})");
    EXPECT_EQ(json::parse(lines[1])["id"], 10);
}

TEST_F(EndToEndTest, ErrorsAreReportedWithCodes) {
    SendRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                 {"params", {{"name", "nope"}, {"arguments", json::object()}}}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
                 {"params", {{"name", "echo"}, {"arguments", json::object()}}}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "unknown/method"}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"}, {"params", json::object()}});

    auto lines = RunAndCollectLines();

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(json::parse(lines[0])["error"]["code"], kToolNotFound);
    EXPECT_EQ(json::parse(lines[1])["error"]["code"], kValidationError);
    EXPECT_EQ(json::parse(lines[2])["error"]["code"], kMethodNotFound);
    EXPECT_EQ(json::parse(lines[2])["error"]["message"], "Method not found: unknown/method");
    EXPECT_EQ(json::parse(lines[3])["error"]["code"], kInvalidParams);

    // Lookup and validation failures never reach the tool hooks.
    EXPECT_EQ(metrics->get_metrics()["totalRequests"], 0);
}

TEST_F(EndToEndTest, UnframeableResultBecomesError) {
    SendRequest({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
                 {"params", {{"name", "multiline"}, {"arguments", json::object()}}}});

    auto lines = RunAndCollectLines();

    ASSERT_EQ(lines.size(), 1u);
    json reply = json::parse(lines[0]);
    EXPECT_EQ(reply["id"], 7);
    EXPECT_FALSE(reply.contains("result"));
    EXPECT_EQ(reply["error"]["code"], kInternalError);
}

TEST_F(EndToEndTest, StatusToolReportsServerAndMetrics) {
    SendRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                 {"params", {{"name", "echo"}, {"arguments", {{"message", "warm-up"}}}}}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
                 {"params", {{"name", "server_status"}, {"arguments", json::object()}}}});

    auto lines = RunAndCollectLines();

    ASSERT_EQ(lines.size(), 2u);
    json reply = json::parse(lines[1]);
    json status = json::parse(reply["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(status["name"], "e2e-server");
    EXPECT_EQ(status["running"], true);
    EXPECT_EQ(status["transport"], "stdio");
    EXPECT_EQ(status["tools"], 3);
    EXPECT_EQ(status["plugins"], 2);
    EXPECT_EQ(status["metrics"]["toolCalls"]["echo"], 1);
    EXPECT_EQ(status["metrics"]["toolCalls"]["server_status"], 1);
}

#include "mcp/MCPServer.hpp"
#include "mcp/MockTransport.hpp"
#include "plugins/LoggingPlugin.hpp"
#include "plugins/MetricsPlugin.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <stdexcept>

using namespace mcpx;

class ExamplePluginsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
        logger = std::make_shared<spdlog::logger>("plugins-test", sink);

        mock_transport_raw = new MockTransport(logger);
        server = std::make_unique<MCPServer>(ServerConfig{}, std::unique_ptr<ITransport>(mock_transport_raw), logger);

        server->register_tool({"ok", "Always succeeds", {{"type", "object"}}},
                              [](const json&, const ToolContext&) { return json("done"); });
        server->register_tool({"broken", "Always fails", {{"type", "object"}}},
                              [](const json&, const ToolContext&) -> json { throw std::runtime_error("broken tool"); });
    }

    void call(int id, const std::string& tool) {
        mock_transport_raw->deliver(MockTransport::kDefaultClient,
                                    Message::request(id, "tools/call", {{"name", tool}, {"arguments", json::object()}}));
    }

    std::ostringstream log_output;
    std::shared_ptr<spdlog::logger> logger;
    MockTransport* mock_transport_raw = nullptr;
    std::unique_ptr<MCPServer> server;
};

TEST_F(ExamplePluginsTest, MetricsPluginCountsCallsAndErrors) {
    auto metrics = std::make_shared<MetricsPlugin>();
    server->register_plugin(metrics);
    server->start();

    call(1, "ok");
    call(2, "ok");
    call(3, "broken");

    json snapshot = metrics->get_metrics();
    EXPECT_EQ(snapshot["totalRequests"], 3);
    EXPECT_EQ(snapshot["totalErrors"], 1);
    EXPECT_EQ(snapshot["toolCalls"]["ok"], 2);
    EXPECT_EQ(snapshot["toolCalls"]["broken"], 1);
    EXPECT_GE(snapshot["averageDuration"].get<double>(), 0.0);

    server->stop();
}

TEST_F(ExamplePluginsTest, MetricsPluginResetsOnCleanup) {
    auto metrics = std::make_shared<MetricsPlugin>();
    server->register_plugin(metrics);
    server->start();
    call(1, "ok");

    server->plugins().unload("metrics-plugin");

    json snapshot = metrics->get_metrics();
    EXPECT_EQ(snapshot["totalRequests"], 0);
    EXPECT_TRUE(snapshot["toolCalls"].empty());
    EXPECT_EQ(snapshot["averageDuration"], 0.0);
    server->stop();
}

TEST_F(ExamplePluginsTest, LoggingPluginLogsConnectionsAndToolErrors) {
    server->register_plugin(std::make_shared<LoggingPlugin>());
    server->start();

    mock_transport_raw->connect("second-client");
    call(1, "broken");
    mock_transport_raw->disconnect("second-client");

    const std::string logs = log_output.str();
    EXPECT_NE(logs.find("[logging-plugin] client connected: mock-client"), std::string::npos);
    EXPECT_NE(logs.find("[logging-plugin] client connected: second-client"), std::string::npos);
    EXPECT_NE(logs.find("[logging-plugin] tool broken failed for mock-client: broken tool"), std::string::npos);
    EXPECT_NE(logs.find("[logging-plugin] client disconnected: second-client"), std::string::npos);
    server->stop();
}

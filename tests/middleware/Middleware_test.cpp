#include "core/Errors.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/MockTransport.hpp"
#include "middleware/RequestLoggingMiddleware.hpp"
#include "middleware/TimeoutMiddleware.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <chrono>
#include <sstream>
#include <thread>

using namespace mcpx;
using namespace std::chrono_literals;

class MiddlewareTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
        logger = std::make_shared<spdlog::logger>("middleware-test", sink);

        mock_transport_raw = new MockTransport(logger);
        server = std::make_unique<MCPServer>(ServerConfig{}, std::unique_ptr<ITransport>(mock_transport_raw), logger);

        server->register_tool({"fast", "Returns at once", {{"type", "object"}}},
                              [](const json&, const ToolContext&) { return json("fast"); });
        server->register_tool({"slow", "Sleeps briefly", {{"type", "object"}}},
                              [](const json&, const ToolContext&) {
                                  std::this_thread::sleep_for(60ms);
                                  return json("slow");
                              });

        // Outermost stage, records what inner stages left in the metadata.
        server->register_middleware({"capture", 1000, [this](const Message&, MiddlewareContext& context, const Next& next) {
            try {
                next();
            } catch (const std::exception&) {
                captured = context.metadata;
                throw;
            }
            captured = context.metadata;
        }});
        server->start();
    }

    void TearDown() override {
        server->stop();
    }

    json call(int id, const std::string& tool) {
        mock_transport_raw->deliver(MockTransport::kDefaultClient,
                                    Message::request(id, "tools/call", {{"name", tool}, {"arguments", json::object()}}));
        return mock_transport_raw->pop_response();
    }

    std::ostringstream log_output;
    std::shared_ptr<spdlog::logger> logger;
    MockTransport* mock_transport_raw = nullptr;
    std::unique_ptr<MCPServer> server;
    json captured = json::object();
};

TEST_F(MiddlewareTest, RequestLoggingRecordsDuration) {
    server->register_middleware(make_request_logging_middleware());

    json response = call(1, "fast");

    EXPECT_TRUE(response.contains("result"));
    ASSERT_TRUE(captured.contains("duration_ms"));
    EXPECT_GE(captured["duration_ms"].get<double>(), 0.0);
    EXPECT_NE(log_output.str().find("Incoming request 'tools/call' from mock-client"), std::string::npos);
}

TEST_F(MiddlewareTest, RequestLoggingRethrowsDownstreamErrors) {
    server->register_middleware(make_request_logging_middleware());

    json response = call(2, "missing");

    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], kToolNotFound);
    EXPECT_TRUE(captured.contains("duration_ms"));
}

TEST_F(MiddlewareTest, TimeoutPassesFastRequests) {
    TimeoutOptions options;
    options.timeout = 5000ms;
    server->register_middleware(make_timeout_middleware(options));

    json response = call(3, "fast");

    EXPECT_EQ(response["result"]["content"][0]["text"], "fast");
    EXPECT_FALSE(captured.contains("timeout"));
}

TEST_F(MiddlewareTest, TimeoutTurnsSlowReplyIntoError) {
    TimeoutOptions options;
    options.timeout = 10ms;
    server->register_middleware(make_timeout_middleware(options));

    json response = call(4, "slow");

    ASSERT_TRUE(response.contains("error"));
    EXPECT_FALSE(response.contains("result"));
    EXPECT_EQ(response["id"], 4);
    EXPECT_EQ(response["error"]["code"], kTimeoutError);
    EXPECT_EQ(response["error"]["message"], "Request timeout: Exceeded 10ms");
    EXPECT_EQ(response["error"]["data"]["timeoutMs"], 10);
    EXPECT_EQ(captured["timeout"], true);
    EXPECT_EQ(captured["timeoutMs"], 10);
    EXPECT_EQ(mock_transport_raw->response_count(), 0u);
}

TEST_F(MiddlewareTest, PerToolTimeoutOverridesDefault) {
    TimeoutOptions options;
    options.timeout = 10ms;
    options.message = "Too slow";
    options.tool_timeouts["slow"] = 5000ms;
    server->register_middleware(make_timeout_middleware(options));

    json response = call(5, "slow");

    EXPECT_EQ(response["result"]["content"][0]["text"], "slow");
}

TEST_F(MiddlewareTest, PerToolTimeoutCanBeStricter) {
    TimeoutOptions options;
    options.timeout = 5000ms;
    options.message = "Too slow";
    options.tool_timeouts["slow"] = 5ms;
    server->register_middleware(make_timeout_middleware(options));

    EXPECT_TRUE(call(6, "fast").contains("result"));

    json response = call(7, "slow");
    EXPECT_EQ(response["error"]["code"], kTimeoutError);
    EXPECT_EQ(response["error"]["message"], "Too slow: Exceeded 5ms");
}

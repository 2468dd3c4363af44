#include "mcp/TransportFactory.hpp"
#include <gtest/gtest.h>

using namespace mcpx;

TEST(TransportFactoryTest, StdioIsAlwaysAvailable) {
    TransportConfig config;
    config.type = TransportType::Stdio;

    auto transport = create_transport(config);

    ASSERT_NE(transport, nullptr);
    EXPECT_EQ(transport->name(), "stdio");
    EXPECT_FALSE(transport->is_started());
}

TEST(TransportFactoryTest, WebSocketIsRejected) {
    TransportConfig config;
    config.type = TransportType::WebSocket;

    EXPECT_FALSE(transport_available(TransportType::WebSocket));
    EXPECT_THROW(create_transport(config), std::invalid_argument);
}

#ifdef MCPX_WITH_HTTP
TEST(TransportFactoryTest, NetworkTransportsAreBuilt) {
    TransportConfig config;
    config.port = 0;

    config.type = TransportType::Http;
    EXPECT_EQ(create_transport(config)->name(), "http");

    config.type = TransportType::Sse;
    EXPECT_EQ(create_transport(config)->name(), "sse");
}
#else
TEST(TransportFactoryTest, NetworkTransportsReportUnavailable) {
    TransportConfig config;
    config.type = TransportType::Http;

    EXPECT_FALSE(transport_available(TransportType::Sse));
    EXPECT_THROW(create_transport(config), std::invalid_argument);
}
#endif

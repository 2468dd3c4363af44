#include "core/ServerConfig.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace mcpx;
namespace fs = std::filesystem;

class ServerConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!config_file.empty()) {
            fs::remove(config_file);
        }
    }

    fs::path write_config(const std::string& content) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        config_file = fs::temp_directory_path() / (std::string("mcpx_") + info->name() + ".json");
        std::ofstream out(config_file);
        out << content;
        return config_file;
    }

    fs::path config_file;
};

TEST_F(ServerConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.name, "mcpx");
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.transport.type, TransportType::Stdio);
    EXPECT_EQ(config.transport.host, "127.0.0.1");
    EXPECT_EQ(config.transport.port, 3000);
}

TEST_F(ServerConfigTest, OverlayReplacesOnlyGivenKeys) {
    ServerConfig config;
    apply_config_json(config, {
        {"name", "custom"},
        {"transport", {{"type", "sse"}, {"port", 8080}}},
        {"unknown", "ignored"}
    });

    EXPECT_EQ(config.name, "custom");
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.transport.type, TransportType::Sse);
    EXPECT_EQ(config.transport.host, "127.0.0.1");
    EXPECT_EQ(config.transport.port, 8080);
}

TEST_F(ServerConfigTest, RejectsWrongTypesAndValues) {
    ServerConfig config;
    EXPECT_THROW(apply_config_json(config, {{"name", 5}}), std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", "stdio"}}), std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", {{"type", "carrier-pigeon"}}}}), std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", {{"port", 70000}}}}), std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", {{"port", "80"}}}}), std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", {{"port", 4294967297LL}}}}), std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", {{"port", std::uint64_t{18446744073709551615ULL}}}}}),
                 std::invalid_argument);
    EXPECT_THROW(apply_config_json(config, {{"transport", {{"port", -1}}}}), std::invalid_argument);
    EXPECT_EQ(config.transport.port, 3000);
    EXPECT_THROW(apply_config_json(config, json::array()), std::invalid_argument);
}

TEST_F(ServerConfigTest, LoadsFile) {
    auto path = write_config(R"({"name": "from-file", "log_level": "debug", "transport": {"type": "http"}})");

    ServerConfig config = load_config_file(path);

    EXPECT_EQ(config.name, "from-file");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.transport.type, TransportType::Http);
}

TEST_F(ServerConfigTest, MissingOrMalformedFile) {
    EXPECT_THROW(load_config_file("/nonexistent/mcpx.json"), std::invalid_argument);

    auto path = write_config("{ not json");
    EXPECT_THROW(load_config_file(path), std::invalid_argument);
}

TEST_F(ServerConfigTest, TransportTypeNames) {
    EXPECT_STREQ(to_string(TransportType::WebSocket), "websocket");
    EXPECT_EQ(transport_type_from_string("http"), TransportType::Http);
    EXPECT_FALSE(transport_type_from_string("tcp").has_value());
}

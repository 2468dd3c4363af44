#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief Transport kinds the server can be configured with
 */
enum class TransportType {
    Stdio,
    Http,
    Sse,
    WebSocket
};

const char* to_string(TransportType type);

std::optional<TransportType> transport_type_from_string(const std::string& name);

struct TransportConfig {
    TransportType type = TransportType::Stdio;
    std::string host = "127.0.0.1";
    int port = 3000;
};

struct ServerConfig {
    std::string name = "mcpx";
    std::string version = "1.0.0";
    std::string log_level = "info";
    TransportConfig transport;
};

/**
 * @brief Overlay a JSON document onto a configuration
 *
 * Recognized keys: name, version, log_level, transport.{type,host,port}.
 * Unknown keys are ignored.
 *
 * @throws std::invalid_argument on wrong value types or unknown transport type
 */
void apply_config_json(ServerConfig& config, const json& document);

/**
 * @brief Load a JSON configuration file on top of the defaults
 * @throws std::invalid_argument if the file is missing or malformed
 */
ServerConfig load_config_file(const std::filesystem::path& path);

} // namespace mcpx

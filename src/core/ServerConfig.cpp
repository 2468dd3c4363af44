#include "ServerConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace mcpx {

namespace {

std::string read_string(const json& document, const char* key, const std::string& current) {
    if (!document.contains(key)) {
        return current;
    }
    if (!document[key].is_string()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be a string");
    }
    return document[key].get<std::string>();
}

} // namespace

const char* to_string(TransportType type) {
    switch (type) {
        case TransportType::Stdio:     return "stdio";
        case TransportType::Http:      return "http";
        case TransportType::Sse:       return "sse";
        case TransportType::WebSocket: return "websocket";
    }
    return "stdio";
}

std::optional<TransportType> transport_type_from_string(const std::string& name) {
    if (name == "stdio") return TransportType::Stdio;
    if (name == "http") return TransportType::Http;
    if (name == "sse") return TransportType::Sse;
    if (name == "websocket") return TransportType::WebSocket;
    return std::nullopt;
}

void apply_config_json(ServerConfig& config, const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Config document must be a JSON object");
    }

    config.name = read_string(document, "name", config.name);
    config.version = read_string(document, "version", config.version);
    config.log_level = read_string(document, "log_level", config.log_level);

    if (!document.contains("transport")) {
        return;
    }
    const auto& transport = document["transport"];
    if (!transport.is_object()) {
        throw std::invalid_argument("Config key 'transport' must be an object");
    }

    if (transport.contains("type")) {
        auto type_name = read_string(transport, "type", "");
        auto type = transport_type_from_string(type_name);
        if (!type) {
            throw std::invalid_argument("Unknown transport type: " + type_name);
        }
        config.transport.type = *type;
    }
    config.transport.host = read_string(transport, "host", config.transport.host);
    if (transport.contains("port")) {
        if (!transport["port"].is_number_integer()) {
            throw std::invalid_argument("Config key 'transport.port' must be an integer");
        }
        if (transport["port"].is_number_unsigned() && transport["port"].get<std::uint64_t>() > 65535) {
            throw std::invalid_argument("Config key 'transport.port' out of range: " + transport["port"].dump());
        }
        const auto port = transport["port"].get<std::int64_t>();
        if (port < 0 || port > 65535) {
            throw std::invalid_argument("Config key 'transport.port' out of range: " + std::to_string(port));
        }
        config.transport.port = static_cast<int>(port);
    }
}

ServerConfig load_config_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Cannot open config file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Malformed config file " + path.string() + ": " + e.what());
    }

    ServerConfig config;
    apply_config_json(config, document);
    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

} // namespace mcpx

#pragma once

#include "core/ServerConfig.hpp"
#include "mcp/ITransport.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace mcpx {

/**
 * @brief Whether this build can create a transport of the given type
 *
 * stdio is always available; http and sse need the HTTP module; websocket
 * is never provided.
 */
bool transport_available(TransportType type);

/**
 * @brief Build the transport described by a configuration
 * @param config Transport type, host and port
 * @param logger Logger for the transport (default: spdlog default logger)
 * @throws std::invalid_argument if the type is not available in this build
 */
std::unique_ptr<ITransport> create_transport(const TransportConfig& config,
                                             std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace mcpx

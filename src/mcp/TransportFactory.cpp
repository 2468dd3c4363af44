#include "TransportFactory.hpp"
#include "StdioTransport.hpp"
#include <stdexcept>
#include <string>

#ifdef MCPX_WITH_HTTP
#include "HttpTransport.hpp"
#include "SseTransport.hpp"
#endif

namespace mcpx {

bool transport_available(TransportType type) {
    switch (type) {
        case TransportType::Stdio:
            return true;
        case TransportType::Http:
        case TransportType::Sse:
#ifdef MCPX_WITH_HTTP
            return true;
#else
            return false;
#endif
        case TransportType::WebSocket:
            return false;
    }
    return false;
}

std::unique_ptr<ITransport> create_transport(const TransportConfig& config,
                                             std::shared_ptr<spdlog::logger> logger) {
    if (!transport_available(config.type)) {
        throw std::invalid_argument(std::string("Transport '") + to_string(config.type) +
                                    "' is not available in this build");
    }

    switch (config.type) {
        case TransportType::Stdio:
            return std::make_unique<StdioTransport>(std::cin, std::cout, std::move(logger));
#ifdef MCPX_WITH_HTTP
        case TransportType::Http:
            return std::make_unique<HttpTransport>(config.host, config.port, std::move(logger));
        case TransportType::Sse:
            return std::make_unique<SseTransport>(config.host, config.port, std::move(logger));
#endif
        default:
            break;
    }
    throw std::invalid_argument(std::string("Unsupported transport type: ") + to_string(config.type));
}

} // namespace mcpx

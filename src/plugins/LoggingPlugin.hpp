#pragma once

#include "plugins/IPlugin.hpp"

namespace mcpx {

/**
 * @brief Logs client connections, disconnections and failed tool calls
 */
class LoggingPlugin : public IPlugin {
public:
    std::string name() const override { return "logging-plugin"; }
    std::string version() const override { return "1.0.0"; }

    void initialize(IServerHandle& server) override;
};

} // namespace mcpx

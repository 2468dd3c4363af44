#pragma once

#include "plugins/IPlugin.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief Counts tool calls, failures and execution time through tool hooks
 *
 * Counters reset on cleanup().
 */
class MetricsPlugin : public IPlugin {
public:
    std::string name() const override { return "metrics-plugin"; }
    std::string version() const override { return "1.0.0"; }

    void initialize(IServerHandle& server) override;
    void cleanup() override;

    /**
     * @brief Current counters
     * @return JSON with totalRequests, totalErrors, averageDuration (ms) and
     *         toolCalls (per-tool call counts)
     */
    json get_metrics() const;

private:
    void record_call(const std::string& tool_name);
    void record_completion(const json& data);

    mutable std::mutex mutex_;
    std::uint64_t total_requests_ = 0;
    std::uint64_t total_errors_ = 0;
    double total_duration_ms_ = 0.0;
    std::map<std::string, std::uint64_t> tool_calls_;
};

} // namespace mcpx

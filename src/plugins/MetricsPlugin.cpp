#include "MetricsPlugin.hpp"
#include "mcp/IServerHandle.hpp"

namespace mcpx {

void MetricsPlugin::initialize(IServerHandle& server) {
    server.logger()->info("MetricsPlugin initialized");

    server.register_hook({"metrics-before-tool", HookPhase::BeforeToolExecution, [this](const HookContext& ctx) {
        if (ctx.tool_name) {
            record_call(*ctx.tool_name);
        }
    }});

    server.register_hook({"metrics-after-tool", HookPhase::AfterToolExecution, [this](const HookContext& ctx) {
        record_completion(ctx.data);
    }});
}

void MetricsPlugin::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_requests_ = 0;
    total_errors_ = 0;
    total_duration_ms_ = 0.0;
    tool_calls_.clear();
}

json MetricsPlugin::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json calls = json::object();
    for (const auto& [tool, count] : tool_calls_) {
        calls[tool] = count;
    }

    return {
        {"totalRequests", total_requests_},
        {"totalErrors", total_errors_},
        {"averageDuration", total_requests_ > 0 ? total_duration_ms_ / static_cast<double>(total_requests_) : 0.0},
        {"toolCalls", calls}
    };
}

void MetricsPlugin::record_call(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_requests_;
    ++tool_calls_[tool_name];
}

void MetricsPlugin::record_completion(const json& data) {
    if (!data.is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (data.contains("duration_ms") && data["duration_ms"].is_number()) {
        total_duration_ms_ += data["duration_ms"].get<double>();
    }
    if (data.contains("error")) {
        ++total_errors_;
    }
}

} // namespace mcpx

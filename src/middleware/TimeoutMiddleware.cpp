#include "TimeoutMiddleware.hpp"
#include "core/Errors.hpp"

namespace mcpx {

namespace {

std::chrono::milliseconds budget_for(const TimeoutOptions& options, const Message& message) {
    if (!message.method || (*message.method != "tools/call" && *message.method != "tools/execute")) {
        return options.timeout;
    }
    if (!message.params.is_object() || !message.params.contains("name") || !message.params["name"].is_string()) {
        return options.timeout;
    }
    auto it = options.tool_timeouts.find(message.params["name"].get<std::string>());
    return it == options.tool_timeouts.end() ? options.timeout : it->second;
}

} // namespace

Middleware make_timeout_middleware(TimeoutOptions options, int priority) {
    Middleware middleware;
    middleware.name = "timeout";
    middleware.priority = priority;
    middleware.handler = [options = std::move(options)](const Message& message,
                                                        MiddlewareContext& context,
                                                        const Next& next) {
        const auto budget = budget_for(options, message);
        const auto started = std::chrono::steady_clock::now();

        next();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed <= budget) {
            return;
        }

        context.metadata["timeout"] = true;
        context.metadata["timeoutMs"] = budget.count();
        throw TimeoutError(options.message + ": Exceeded " + std::to_string(budget.count()) + "ms",
                           {{"timeoutMs", budget.count()}, {"elapsedMs", elapsed.count()}});
    };
    return middleware;
}

} // namespace mcpx

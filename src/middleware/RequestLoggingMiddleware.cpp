#include "RequestLoggingMiddleware.hpp"
#include <chrono>

namespace mcpx {

Middleware make_request_logging_middleware(int priority) {
    Middleware middleware;
    middleware.name = "request-logging";
    middleware.priority = priority;
    middleware.handler = [](const Message& message, MiddlewareContext& context, const Next& next) {
        auto logger = context.logger ? context.logger : spdlog::default_logger();
        const std::string method = message.method.value_or("<none>");

        logger->info("Incoming {} '{}' from {}", to_string(message.type), method, context.client_id);

        const auto started = std::chrono::steady_clock::now();
        auto elapsed = [&started]() {
            return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        };

        try {
            next();
        } catch (const std::exception& e) {
            context.metadata["duration_ms"] = elapsed();
            logger->error("'{}' from {} failed after {:.2f}ms: {}", method, context.client_id,
                          context.metadata["duration_ms"].get<double>(), e.what());
            throw;
        }

        context.metadata["duration_ms"] = elapsed();
        logger->info("'{}' from {} completed in {:.2f}ms", method, context.client_id,
                     context.metadata["duration_ms"].get<double>());
    };
    return middleware;
}

} // namespace mcpx

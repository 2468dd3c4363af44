#pragma once

#include "core/MiddlewarePipeline.hpp"
#include <chrono>
#include <map>
#include <string>

namespace mcpx {

struct TimeoutOptions {
    std::chrono::milliseconds timeout{30000};
    std::string message = "Request timeout";
    /// Per-tool overrides, matched against tools/call and tools/execute params.name
    std::map<std::string, std::chrono::milliseconds> tool_timeouts;
};

/**
 * @brief Middleware that rejects messages whose downstream chain overran its budget,
 *        checked only once next() returns (a hung handler is never interrupted)
 *
 * Dispatch is synchronous, so the deadline is checked when next() returns.
 * On overrun "timeout" and "timeoutMs" are recorded in the context metadata
 * and TimeoutError is thrown, which replaces the pending reply with an
 * error envelope.
 */
Middleware make_timeout_middleware(TimeoutOptions options = {}, int priority = 95);

} // namespace mcpx

#pragma once

#include "core/MiddlewarePipeline.hpp"

namespace mcpx {

/**
 * @brief Middleware that logs each message and how long the rest of the chain took
 *
 * Stores the elapsed time as "duration_ms" in the context metadata. Errors
 * from downstream are logged and rethrown unchanged.
 *
 * @param priority Chain priority (default: runs before most middleware)
 */
Middleware make_request_logging_middleware(int priority = 90);

} // namespace mcpx

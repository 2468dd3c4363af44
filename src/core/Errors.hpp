#pragma once

#include <nlohmann/json.hpp>
#include <exception>
#include <stdexcept>
#include <string>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 and server specific error codes
 */
enum ErrorCode : int {
    kParseError = -32700,
    kInvalidRequest = -32600,
    kMethodNotFound = -32601,
    kInvalidParams = -32602,
    kInternalError = -32603,
    kToolNotFound = -32001,
    kToolExecutionError = -32002,
    kValidationError = -32003,
    kTransportError = -32004,
    kAuthorizationError = -32005,
    kTimeoutError = -32006,
    kPluginLifecycleError = -32007,
};

/**
 * @brief Base class for all errors that carry a wire error code
 *
 * The dispatcher converts any McpError reaching it into the body of an
 * error envelope using code(), what() and data().
 */
class McpError : public std::runtime_error {
public:
    McpError(int code, const std::string& message, json data = nullptr)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const noexcept { return code_; }
    const json& data() const noexcept { return data_; }

private:
    int code_;
    json data_;
};

/// I/O failure, unknown or disconnected client, transport not started.
class TransportError : public McpError {
public:
    explicit TransportError(const std::string& message)
        : McpError(kTransportError, message) {}
};

/// Malformed JSON, invalid envelope shape or a newline inside a frame.
class ProtocolFramingError : public McpError {
public:
    explicit ProtocolFramingError(const std::string& message, int code = kInvalidRequest)
        : McpError(code, message) {}
};

/// Tool input rejected by a schema validator.
class ValidationError : public McpError {
public:
    explicit ValidationError(const std::string& message, json data = nullptr)
        : McpError(kValidationError, message, std::move(data)) {}
};

/// Raised by authentication/authorization middleware.
class AuthorizationError : public McpError {
public:
    explicit AuthorizationError(const std::string& message)
        : McpError(kAuthorizationError, message) {}
};

/// Raised by timing middleware when the downstream chain overruns its budget.
class TimeoutError : public McpError {
public:
    explicit TimeoutError(const std::string& message, json data = nullptr)
        : McpError(kTimeoutError, message, std::move(data)) {}
};

/// Plugin lookup, initialize or cleanup failure.
class PluginLifecycleError : public McpError {
public:
    explicit PluginLifecycleError(const std::string& message)
        : McpError(kPluginLifecycleError, message) {}
};

/// Method (or tool) not registered.
class UnknownMethodError : public McpError {
public:
    explicit UnknownMethodError(const std::string& message, int code = kMethodNotFound)
        : McpError(code, message) {}
};

/**
 * @brief Convert an exception into an error envelope body
 * @param error Any exception caught at the dispatcher boundary
 * @return JSON object with "code", "message" and optional "data"
 */
json to_error_object(const std::exception& error);

/**
 * @brief Build an error envelope body from parts
 */
json make_error_object(int code, const std::string& message, const json& data = nullptr);

} // namespace mcpx

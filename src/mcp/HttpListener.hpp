#pragma once

#include "core/Message.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpx {

/**
 * @brief Owns an httplib::Server and the thread that accepts on it
 *
 * Routes are registered on server() before start(). start() binds
 * synchronously so bind failures surface to the caller; accepting then
 * continues on a background thread until stop().
 */
class HttpListener {
public:
    HttpListener(std::string host, int port, std::shared_ptr<spdlog::logger> logger);
    ~HttpListener();

    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;

    httplib::Server& server() { return *server_; }

    /**
     * @brief Bind and start accepting
     * @throws TransportError if the address cannot be bound
     */
    void start();

    /**
     * @brief Stop accepting, join the listener thread, release wait()
     */
    void stop();

    /**
     * @brief Block until stop() is called
     */
    void wait();

    /**
     * @brief Port actually bound (resolves port 0), or the configured port before start()
     */
    int port() const { return bound_port_; }

    const std::string& host() const { return host_; }

private:
    std::string host_;
    int port_;
    int bound_port_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;

    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;
    bool running_ = false;
};

/**
 * @brief Decode one HTTP request body into an envelope
 * @throws ProtocolFramingError with kParseError for invalid JSON, or the
 *         envelope mapping error for a well-formed body of the wrong shape
 */
Message decode_http_body(const std::string& body);

/**
 * @brief JSON-RPC error object for an HTTP error response body
 */
json http_error_body(const json& id, const std::exception& error);

} // namespace mcpx

#pragma once

#include "BaseTransport.hpp"
#include "HttpListener.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpx {

/**
 * @brief Request/response transport over HTTP (cpp-httplib)
 *
 * Endpoints:
 * - POST /mcp    one envelope per request body; the correlated reply is
 *                the response body (202 with an empty body when the
 *                message produces no reply)
 * - GET /health  liveness and transport name
 *
 * The X-Client-Id header names the client; a fresh id is generated when it
 * is absent. A client is connected for the duration of one request.
 * Dispatch is serialized across listener threads.
 */
class HttpTransport : public BaseTransport {
public:
    static constexpr const char* kClientIdHeader = "X-Client-Id";

    HttpTransport(std::string host, int port, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~HttpTransport() override;

    std::string name() const override { return "http"; }

    void start() override;
    void stop() override;
    void run() override;

    /**
     * @brief Store the reply for a client whose request is in flight
     * @throws TransportError if not started or no request from the client is in flight
     */
    void send(const std::string& client_id, const Message& message) override;

    /**
     * @throws TransportError always; HTTP has no persistent peers to push to
     */
    void broadcast(const Message& message) override;

    int port() const { return listener_.port(); }

private:
    void register_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);

    HttpListener listener_;
    std::mutex dispatch_mutex_;
    std::mutex pending_mutex_;
    std::map<std::string, std::optional<json>> pending_;
    std::atomic<unsigned long> next_client_{0};
};

} // namespace mcpx

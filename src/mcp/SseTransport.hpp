#pragma once

#include "BaseTransport.hpp"
#include "HttpListener.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcpx {

/**
 * @brief Server-Sent Events transport (cpp-httplib)
 *
 * Endpoints:
 * - GET /mcp/events    opens a stream; the first event is
 *                      {"type":"connected","clientId":"..."}
 * - POST /mcp/message  one envelope from the client named by X-Client-Id,
 *                      answered with 202; replies arrive on the stream
 * - GET /health        liveness and connected client count
 *
 * Every outbound envelope is one "data: <json>" event. Idle streams get a
 * keepalive comment every kKeepAliveInterval. Closing the stream
 * disconnects the client.
 */
class SseTransport : public BaseTransport {
public:
    static constexpr const char* kClientIdHeader = "X-Client-Id";
    static constexpr std::chrono::seconds kKeepAliveInterval{30};

    SseTransport(std::string host, int port, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~SseTransport() override;

    std::string name() const override { return "sse"; }

    void start() override;
    void stop() override;
    void run() override;

    /**
     * @brief Queue an event on a client's stream
     * @throws TransportError if not started or the client has no open stream
     */
    void send(const std::string& client_id, const Message& message) override;

    int port() const { return listener_.port(); }

private:
    struct Session {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> frames;
        bool closed = false;
    };

    void register_routes();
    void handle_events(const httplib::Request& req, httplib::Response& res);
    void handle_message_post(const httplib::Request& req, httplib::Response& res);

    /**
     * @brief Write queued frames to the stream, or a keepalive when idle
     * @return false once the session is closed or the peer is gone
     */
    static bool pump(Session& session, httplib::DataSink& sink);
    static void enqueue(Session& session, std::string frame);

    /**
     * @brief Close a client's stream and emit disconnect; safe to call twice
     */
    void drop_client(const std::string& client_id);

    HttpListener listener_;
    std::mutex dispatch_mutex_;
    std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::atomic<unsigned long> next_client_{0};
};

} // namespace mcpx

#pragma once

#include "mcp/BaseTransport.hpp"
#include <deque>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mcpx {

/**
 * @brief Mock transport for testing MCP server
 *
 * Uses queues for simulating request/response flow without actual I/O.
 * start() connects kDefaultClient; further clients connect via connect().
 * run() delivers every queued request in order and returns.
 */
class MockTransport : public BaseTransport {
public:
    static constexpr const char* kDefaultClient = "mock-client";

    explicit MockTransport(std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string name() const override { return "mock"; }

    void start() override;
    void stop() override;
    void run() override;
    void send(const std::string& client_id, const Message& message) override;

    /**
     * @brief Queue a wire object for delivery by run()
     * @param request JSON-RPC or envelope object
     * @param client_id Sender
     */
    void push_request(const json& request, const std::string& client_id = kDefaultClient);

    /**
     * @brief Deliver a message immediately, bypassing the queue
     */
    void deliver(const std::string& client_id, const Message& message);

    void connect(const std::string& client_id);
    void disconnect(const std::string& client_id);

    /**
     * @brief Make every later send() to this client throw TransportError
     */
    void fail_sends_to(const std::string& client_id);

    /**
     * @brief Get and remove the oldest sent message (JSON-RPC form)
     * @return Message, or null JSON when nothing was sent
     */
    json pop_response();

    bool has_responses() const { return !sent_.empty(); }
    std::size_t response_count() const { return sent_.size(); }

    /**
     * @brief Messages sent to one client, oldest first, without consuming them
     */
    std::vector<json> sent_to(const std::string& client_id) const;

    /// Number of send() calls that reached this transport, failed or not
    std::size_t send_attempts() const { return send_attempts_; }

private:
    std::deque<std::pair<std::string, json>> requests_;
    std::deque<std::pair<std::string, json>> sent_;
    std::set<std::string> failing_clients_;
    std::size_t send_attempts_ = 0;
};

} // namespace mcpx

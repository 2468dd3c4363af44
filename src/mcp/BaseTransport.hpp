#pragma once

#include "ITransport.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mcpx {

/**
 * @brief Common handler bookkeeping and connection tracking for transports
 *
 * Handlers are expected to be registered before start(); emission does not
 * lock the handler lists. The connection set is guarded so transports that
 * accept peers on worker threads can share it.
 */
class BaseTransport : public ITransport {
public:
    explicit BaseTransport(std::shared_ptr<spdlog::logger> logger = nullptr);

    void on_message(MessageHandler handler) override;
    void on_connect(ConnectHandler handler) override;
    void on_disconnect(DisconnectHandler handler) override;

    /**
     * @brief Send to a snapshot of clients(), logging per-peer failures
     */
    void broadcast(const Message& message) override;

    bool is_started() const override { return started_; }
    std::vector<std::string> clients() const override;

protected:
    /**
     * @brief Run message handlers in registration order
     *
     * A handler exception stops the remaining handlers for this event and
     * propagates to the caller.
     */
    void emit_message(const std::string& client_id, const Message& message);
    void emit_connect(const std::string& client_id);
    void emit_disconnect(const std::string& client_id);

    void add_client(const std::string& client_id);

    /**
     * @return true if the client was connected
     */
    bool remove_client(const std::string& client_id);

    bool has_client(const std::string& client_id) const;

    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

    std::atomic<bool> started_{false};

private:
    std::vector<MessageHandler> message_handlers_;
    std::vector<ConnectHandler> connect_handlers_;
    std::vector<DisconnectHandler> disconnect_handlers_;

    mutable std::mutex clients_mutex_;
    std::set<std::string> clients_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcpx

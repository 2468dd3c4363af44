#include "BaseTransport.hpp"
#include "core/Errors.hpp"
#include <stdexcept>

namespace mcpx {

BaseTransport::BaseTransport(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void BaseTransport::on_message(MessageHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Message handler cannot be null");
    }
    message_handlers_.push_back(std::move(handler));
}

void BaseTransport::on_connect(ConnectHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Connect handler cannot be null");
    }
    connect_handlers_.push_back(std::move(handler));
}

void BaseTransport::on_disconnect(DisconnectHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Disconnect handler cannot be null");
    }
    disconnect_handlers_.push_back(std::move(handler));
}

void BaseTransport::broadcast(const Message& message) {
    if (!started_) {
        throw TransportError(name() + " transport is not started");
    }

    const auto targets = clients();
    std::size_t delivered = 0;

    for (const auto& client_id : targets) {
        try {
            send(client_id, message);
            ++delivered;
        } catch (const std::exception& e) {
            logger_->warn("Broadcast to {} failed: {}", client_id, e.what());
        }
    }

    logger_->debug("Broadcast delivered to {}/{} clients", delivered, targets.size());
}

std::vector<std::string> BaseTransport::clients() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return {clients_.begin(), clients_.end()};
}

void BaseTransport::emit_message(const std::string& client_id, const Message& message) {
    for (const auto& handler : message_handlers_) {
        handler(client_id, message);
    }
}

void BaseTransport::emit_connect(const std::string& client_id) {
    for (const auto& handler : connect_handlers_) {
        handler(client_id);
    }
}

void BaseTransport::emit_disconnect(const std::string& client_id) {
    for (const auto& handler : disconnect_handlers_) {
        handler(client_id);
    }
}

void BaseTransport::add_client(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.insert(client_id);
}

bool BaseTransport::remove_client(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.erase(client_id) > 0;
}

bool BaseTransport::has_client(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.count(client_id) > 0;
}

} // namespace mcpx

#include "MockTransport.hpp"
#include "core/Errors.hpp"

namespace mcpx {

MockTransport::MockTransport(std::shared_ptr<spdlog::logger> logger)
    : BaseTransport(std::move(logger)) {
}

void MockTransport::start() {
    if (started_) {
        throw TransportError("Mock transport is already started");
    }
    started_ = true;
    connect(kDefaultClient);
}

void MockTransport::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    for (const auto& client_id : clients()) {
        disconnect(client_id);
    }
}

void MockTransport::run() {
    while (started_ && !requests_.empty()) {
        auto [client_id, request] = requests_.front();
        requests_.pop_front();

        if (!has_client(client_id)) {
            connect(client_id);
        }
        deliver(client_id, message_from_wire(request));
    }
}

void MockTransport::send(const std::string& client_id, const Message& message) {
    ++send_attempts_;
    if (!started_) {
        throw TransportError("Mock transport is not started");
    }
    if (!has_client(client_id)) {
        throw TransportError("Client not found: " + client_id);
    }
    if (failing_clients_.count(client_id) > 0) {
        throw TransportError("Injected send failure for " + client_id);
    }
    sent_.emplace_back(client_id, message_to_jsonrpc(message));
}

void MockTransport::push_request(const json& request, const std::string& client_id) {
    requests_.emplace_back(client_id, request);
}

void MockTransport::deliver(const std::string& client_id, const Message& message) {
    emit_message(client_id, message);
}

void MockTransport::connect(const std::string& client_id) {
    add_client(client_id);
    emit_connect(client_id);
}

void MockTransport::disconnect(const std::string& client_id) {
    if (remove_client(client_id)) {
        emit_disconnect(client_id);
    }
}

void MockTransport::fail_sends_to(const std::string& client_id) {
    failing_clients_.insert(client_id);
}

json MockTransport::pop_response() {
    if (sent_.empty()) {
        return json();
    }

    json response = sent_.front().second;
    sent_.pop_front();
    return response;
}

std::vector<json> MockTransport::sent_to(const std::string& client_id) const {
    std::vector<json> result;
    for (const auto& [target, message] : sent_) {
        if (target == client_id) {
            result.push_back(message);
        }
    }
    return result;
}

} // namespace mcpx

#include "HttpTransport.hpp"
#include "StdioTransport.hpp"
#include "core/Errors.hpp"

namespace mcpx {

HttpTransport::HttpTransport(std::string host, int port, std::shared_ptr<spdlog::logger> logger)
    : BaseTransport(logger),
      listener_(std::move(host), port, logger) {
    register_routes();
}

HttpTransport::~HttpTransport() {
    try {
        stop();
    } catch (const std::exception& e) {
        logger()->error("Error stopping HTTP transport: {}", e.what());
    }
}

void HttpTransport::register_routes() {
    auto& server = listener_.server();

    server.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json body = {{"status", "ok"}, {"transport", name()}};
        res.set_content(body.dump(), "application/json");
    });
}

void HttpTransport::start() {
    if (started_) {
        throw TransportError("HTTP transport is already started");
    }
    listener_.start();
    started_ = true;
    logger()->info("HTTP transport listening on {}:{}", listener_.host(), listener_.port());
}

void HttpTransport::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    listener_.stop();
    logger()->debug("HTTP transport stopped");
}

void HttpTransport::run() {
    listener_.wait();
}

void HttpTransport::send(const std::string& client_id, const Message& message) {
    if (!started_) {
        throw TransportError("HTTP transport is not started");
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(client_id);
    if (it == pending_.end()) {
        throw TransportError("Client not found: " + client_id);
    }
    it->second = message_to_jsonrpc(message);
}

void HttpTransport::broadcast(const Message&) {
    throw TransportError("Broadcast is not supported by the HTTP transport");
}

void HttpTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    std::string client_id = req.get_header_value(kClientIdHeader);
    if (client_id.empty()) {
        client_id = "http-" + std::to_string(++next_client_);
    }
    res.set_header(kClientIdHeader, client_id);

    Message message;
    try {
        message = decode_http_body(req.body);
    } catch (const ProtocolFramingError& e) {
        logger()->error("Failed to parse HTTP message from {}: {}", client_id, e.what());
        res.status = 400;
        res.set_content(http_error_body(recover_request_id(req.body).value_or(json()), e).dump(),
                        "application/json");
        return;
    }

    std::optional<json> reply;
    {
        std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_[client_id].reset();
        }
        add_client(client_id);

        try {
            emit_connect(client_id);
            emit_message(client_id, message);
        } catch (const std::exception& e) {
            logger()->error("Message handler failed for {}: {}", client_id, e.what());
        }

        remove_client(client_id);
        try {
            emit_disconnect(client_id);
        } catch (const std::exception& e) {
            logger()->error("Disconnect handler failed for {}: {}", client_id, e.what());
        }

        std::lock_guard<std::mutex> lock(pending_mutex_);
        reply = std::move(pending_[client_id]);
        pending_.erase(client_id);
    }

    if (reply) {
        res.set_content(reply->dump(), "application/json");
    } else {
        res.status = 202;
    }
}

} // namespace mcpx

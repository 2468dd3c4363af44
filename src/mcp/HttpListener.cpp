#include "HttpListener.hpp"
#include "core/Errors.hpp"

namespace mcpx {

HttpListener::HttpListener(std::string host, int port, std::shared_ptr<spdlog::logger> logger)
    : host_(std::move(host)),
      port_(port),
      bound_port_(port),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      server_(std::make_unique<httplib::Server>()) {
}

HttpListener::~HttpListener() {
    stop();
}

void HttpListener::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (running_) {
            throw TransportError("HTTP listener is already running");
        }
    }

    if (port_ == 0) {
        bound_port_ = server_->bind_to_any_port(host_);
        if (bound_port_ < 0) {
            throw TransportError("Failed to bind " + host_ + " to any port");
        }
    } else {
        if (!server_->bind_to_port(host_, port_)) {
            throw TransportError("Failed to bind " + host_ + ":" + std::to_string(port_));
        }
        bound_port_ = port_;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = true;
    }

    thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            logger_->error("HTTP listener on {}:{} stopped unexpectedly", host_, bound_port_);
        }
    });

    logger_->info("HTTP listener started on {}:{}", host_, bound_port_);
}

void HttpListener::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    stopped_cv_.notify_all();
    logger_->info("HTTP listener on {}:{} stopped", host_, bound_port_);
}

void HttpListener::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait(lock, [this]() { return !running_; });
}

Message decode_http_body(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error&) {
        throw ProtocolFramingError("Parse error", kParseError);
    }
    return message_from_wire(parsed);
}

json http_error_body(const json& id, const std::exception& error) {
    return message_to_jsonrpc(Message::error_reply(id, to_error_object(error)));
}

} // namespace mcpx

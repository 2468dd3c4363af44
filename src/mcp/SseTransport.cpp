#include "SseTransport.hpp"
#include "StdioTransport.hpp"
#include "core/Errors.hpp"

namespace mcpx {

namespace {

std::string event_frame(const json& payload) {
    return "data: " + payload.dump() + "\n\n";
}

} // namespace

SseTransport::SseTransport(std::string host, int port, std::shared_ptr<spdlog::logger> logger)
    : BaseTransport(logger),
      listener_(std::move(host), port, logger) {
    register_routes();
}

SseTransport::~SseTransport() {
    try {
        stop();
    } catch (const std::exception& e) {
        logger()->error("Error stopping SSE transport: {}", e.what());
    }
}

void SseTransport::register_routes() {
    auto& server = listener_.server();

    server.Get("/mcp/events", [this](const httplib::Request& req, httplib::Response& res) {
        handle_events(req, res);
    });

    server.Post("/mcp/message", [this](const httplib::Request& req, httplib::Response& res) {
        handle_message_post(req, res);
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json body = {{"status", "ok"}, {"transport", name()}, {"clients", clients().size()}};
        res.set_content(body.dump(), "application/json");
    });
}

void SseTransport::start() {
    if (started_) {
        throw TransportError("SSE transport is already started");
    }
    listener_.start();
    started_ = true;
    logger()->info("SSE transport listening on {}:{}", listener_.host(), listener_.port());
}

void SseTransport::stop() {
    if (!started_) {
        return;
    }
    started_ = false;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [client_id, session] : sessions_) {
            {
                std::lock_guard<std::mutex> session_lock(session->mutex);
                session->closed = true;
            }
            session->cv.notify_all();
        }
    }

    listener_.stop();

    // Streams whose releaser never ran still count as connected.
    for (const auto& client_id : clients()) {
        drop_client(client_id);
    }
    logger()->debug("SSE transport stopped");
}

void SseTransport::run() {
    listener_.wait();
}

void SseTransport::send(const std::string& client_id, const Message& message) {
    if (!started_) {
        throw TransportError("SSE transport is not started");
    }

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(client_id);
        if (it == sessions_.end()) {
            throw TransportError("Client not found: " + client_id);
        }
        session = it->second;
    }

    enqueue(*session, event_frame(message_to_jsonrpc(message)));
}

void SseTransport::handle_events(const httplib::Request&, httplib::Response& res) {
    const std::string client_id = "sse-" + std::to_string(++next_client_);
    auto session = std::make_shared<Session>();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[client_id] = session;
    }
    add_client(client_id);
    enqueue(*session, event_frame({{"type", "connected"}, {"clientId", client_id}}));

    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        try {
            emit_connect(client_id);
        } catch (const std::exception& e) {
            logger()->error("Connect handler failed for {}: {}", client_id, e.what());
        }
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header(kClientIdHeader, client_id);
    res.set_chunked_content_provider(
        "text/event-stream",
        [session](size_t, httplib::DataSink& sink) {
            return pump(*session, sink);
        },
        [this, client_id](bool) {
            drop_client(client_id);
        });
}

void SseTransport::handle_message_post(const httplib::Request& req, httplib::Response& res) {
    const std::string client_id = req.get_header_value(kClientIdHeader);
    if (client_id.empty()) {
        res.status = 400;
        res.set_content(json{{"error", "Missing X-Client-Id header"}}.dump(), "application/json");
        return;
    }
    if (!has_client(client_id)) {
        res.status = 404;
        res.set_content(json{{"error", "Client not found: " + client_id}}.dump(), "application/json");
        return;
    }

    Message message;
    try {
        message = decode_http_body(req.body);
    } catch (const ProtocolFramingError& e) {
        logger()->error("Failed to parse SSE message from {}: {}", client_id, e.what());
        res.status = 400;
        res.set_content(http_error_body(recover_request_id(req.body).value_or(json()), e).dump(),
                        "application/json");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        try {
            emit_message(client_id, message);
        } catch (const std::exception& e) {
            logger()->error("Message handler failed for {}: {}", client_id, e.what());
        }
    }

    res.status = 202;
    res.set_content(json{{"status", "accepted"}}.dump(), "application/json");
}

bool SseTransport::pump(Session& session, httplib::DataSink& sink) {
    std::deque<std::string> frames;
    {
        std::unique_lock<std::mutex> lock(session.mutex);
        session.cv.wait_for(lock, kKeepAliveInterval, [&session]() {
            return session.closed || !session.frames.empty();
        });
        if (session.closed) {
            return false;
        }
        frames.swap(session.frames);
    }

    if (frames.empty()) {
        frames.push_back(": keepalive\n\n");
    }
    for (const auto& frame : frames) {
        if (!sink.write(frame.data(), frame.size())) {
            return false;
        }
    }
    return true;
}

void SseTransport::enqueue(Session& session, std::string frame) {
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.frames.push_back(std::move(frame));
    }
    session.cv.notify_one();
}

void SseTransport::drop_client(const std::string& client_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(client_id);
        if (it != sessions_.end()) {
            session = it->second;
            sessions_.erase(it);
        }
    }

    if (session) {
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            session->closed = true;
        }
        session->cv.notify_all();
    }

    if (!remove_client(client_id)) {
        return;
    }

    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    try {
        emit_disconnect(client_id);
    } catch (const std::exception& e) {
        logger()->error("Disconnect handler failed for {}: {}", client_id, e.what());
    }
}

} // namespace mcpx

#include "StdioTransport.hpp"
#include "core/Errors.hpp"
#include <cstdint>
#include <regex>
#include <string>

namespace mcpx {

std::optional<json> recover_request_id(std::string_view raw) {
    static const std::regex string_id(R"re("id"\s*:\s*"([^"]+)")re");
    static const std::regex numeric_id(R"re("id"\s*:\s*(-?\d+))re");

    const std::string text(raw);
    std::smatch match;

    if (std::regex_search(text, match, string_id)) {
        return json(match[1].str());
    }
    if (std::regex_search(text, match, numeric_id)) {
        try {
            return json(static_cast<std::int64_t>(std::stoll(match[1].str())));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool contains_newline(const json& value) {
    if (value.is_string()) {
        return value.get_ref<const std::string&>().find('\n') != std::string::npos;
    }
    if (value.is_object()) {
        for (const auto& [key, item] : value.items()) {
            if (key.find('\n') != std::string::npos || contains_newline(item)) {
                return true;
            }
        }
        return false;
    }
    if (value.is_array()) {
        for (const auto& item : value) {
            if (contains_newline(item)) {
                return true;
            }
        }
    }
    return false;
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, std::shared_ptr<spdlog::logger> logger)
    : BaseTransport(std::move(logger)), in_(in), out_(out) {
    this->logger()->debug("StdioTransport initialized");
}

void StdioTransport::start() {
    if (started_) {
        throw TransportError("STDIO transport is already started");
    }

    started_ = true;
    add_client(kClientId);

    try {
        emit_connect(kClientId);
    } catch (...) {
        started_ = false;
        remove_client(kClientId);
        throw;
    }
    logger()->debug("StdioTransport started");
}

void StdioTransport::stop() {
    if (!started_) {
        return;
    }
    close_connection();
    logger()->debug("StdioTransport stopped");
}

void StdioTransport::run() {
    std::string line;

    while (started_ && std::getline(in_, line)) {
        handle_line(std::move(line));
    }

    if (in_.eof()) {
        logger()->debug("Reached end of input stream");
    } else if (in_.bad()) {
        logger()->error("Error reading from input stream");
    }

    if (started_) {
        close_connection();
    }
}

void StdioTransport::handle_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) {
        logger()->debug("Read empty line, skipping");
        return;
    }

    json parsed;
    try {
        parsed = json::parse(line);
    } catch (const json::parse_error& e) {
        handle_parse_failure(line, e.what());
        return;
    }

    if (contains_newline(parsed)) {
        logger()->error("Failed to parse STDIO message: message contains embedded newlines");
        return;
    }

    Message message;
    try {
        message = message_from_wire(parsed);
    } catch (const ProtocolFramingError& e) {
        logger()->error("Failed to parse STDIO message: {}", e.what());
        if (parsed.is_object() && parsed.contains("id")) {
            try {
                send(kClientId, Message::error_reply(parsed["id"], to_error_object(e)));
            } catch (const std::exception& send_error) {
                logger()->error("Failed to send Invalid Request reply: {}", send_error.what());
            }
        }
        return;
    }

    logger()->debug("Read message: {}", line);

    try {
        emit_message(kClientId, message);
    } catch (const std::exception& e) {
        logger()->error("Message handler failed: {}", e.what());
    }
}

void StdioTransport::handle_parse_failure(const std::string& line, const std::string& reason) {
    auto id = recover_request_id(line);
    if (!id) {
        logger()->error("Failed to parse STDIO message: {} (no id to answer)", reason);
        return;
    }
    logger()->error("Failed to parse STDIO message: {}", reason);

    // Field order is part of the wire contract: id first, then error.
    nlohmann::ordered_json reply;
    if (id->is_string()) {
        reply["id"] = id->get<std::string>();
    } else {
        reply["id"] = id->get<std::int64_t>();
    }
    reply["error"]["code"] = static_cast<int>(kParseError);
    reply["error"]["message"] = "Parse error";

    try {
        write_frame(reply.dump());
    } catch (const std::exception& e) {
        logger()->error("Failed to write parse error response: {}", e.what());
    }
}

void StdioTransport::send(const std::string& client_id, const Message& message) {
    if (!started_) {
        throw TransportError("STDIO transport is not started");
    }
    if (client_id != kClientId) {
        throw TransportError("Client not found: " + client_id);
    }

    json wire = message_to_jsonrpc(message);
    if (contains_newline(wire)) {
        throw ProtocolFramingError("Serialized message contains embedded newlines", kInternalError);
    }

    std::string frame = wire.dump();
    if (frame.find('\n') != std::string::npos) {
        throw ProtocolFramingError("Serialized message contains embedded newlines", kInternalError);
    }

    write_frame(frame);
    logger()->debug("Wrote message: {}", frame);
}

void StdioTransport::write_frame(const std::string& frame) {
    std::string buffer;
    buffer.reserve(frame.size() + 1);
    buffer.append(frame).push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    out_.flush();
    if (!out_) {
        throw TransportError("Failed to write to output stream");
    }
}

void StdioTransport::close_connection() {
    started_ = false;
    if (remove_client(kClientId)) {
        emit_disconnect(kClientId);
    }
}

} // namespace mcpx

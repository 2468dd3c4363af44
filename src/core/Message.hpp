#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief Kind of envelope exchanged over a transport
 */
enum class MessageType {
    Request,
    Response,
    Error,
    Event
};

/**
 * @brief Get the wire name of a message type ("request", "response", ...)
 */
const char* to_string(MessageType type);

/**
 * @brief Parse a wire name into a message type
 * @return Type or std::nullopt for unknown names
 */
std::optional<MessageType> message_type_from_string(const std::string& name);

/**
 * @brief Envelope shared by transports, middleware and the dispatcher
 *
 * A response or error answering a request carries the same id.
 * An event has no id and expects no reply.
 * The id keeps its JSON type (string or number) so replies correlate
 * byte-for-byte with what the peer sent.
 */
struct Message {
    MessageType type = MessageType::Request;
    std::optional<json> id;
    std::optional<std::string> method;
    json params;
    json result;
    json error;

    bool has_id() const { return id.has_value(); }
    bool expects_reply() const { return type == MessageType::Request && id.has_value(); }

    static Message request(json id, std::string method, json params = json::object());
    static Message event(std::string method, json params = json::object());
    static Message response(json id, json result);
    static Message error_reply(std::optional<json> id, json error);
};

/**
 * @brief Serialize to the native envelope form ({"type": "...", ...})
 */
json message_to_json(const Message& message);

/**
 * @brief Parse the native envelope form
 * @throws ProtocolFramingError on a missing or unknown "type"
 */
Message message_from_json(const json& object);

/**
 * @brief Serialize to a JSON-RPC 2.0 object
 */
json message_to_jsonrpc(const Message& message);

/**
 * @brief Map a JSON-RPC 2.0 object onto an envelope
 *
 * method + id -> request, method without id -> event,
 * result + id -> response, error + id -> error.
 *
 * @throws ProtocolFramingError when the object matches none of these shapes
 */
Message message_from_jsonrpc(const json& object);

/**
 * @brief Decode a wire object in either form
 *
 * Objects with a string "type" member use the native envelope form,
 * everything else is treated as JSON-RPC 2.0.
 */
Message message_from_wire(const json& object);

} // namespace mcpx

#include "Message.hpp"
#include "Errors.hpp"

namespace mcpx {

namespace {

std::optional<std::string> read_method(const json& object) {
    if (!object.contains("method")) {
        return std::nullopt;
    }
    const auto& method = object["method"];
    if (!method.is_string()) {
        throw ProtocolFramingError("Invalid Request: method must be a string");
    }
    return method.get<std::string>();
}

std::optional<json> read_id(const json& object) {
    if (!object.contains("id")) {
        return std::nullopt;
    }
    const auto& id = object["id"];
    if (!id.is_string() && !id.is_number_integer() && !id.is_null()) {
        throw ProtocolFramingError("Invalid Request: id must be a string or an integer");
    }
    return id;
}

} // namespace

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Request:  return "request";
        case MessageType::Response: return "response";
        case MessageType::Error:    return "error";
        case MessageType::Event:    return "event";
    }
    return "request";
}

std::optional<MessageType> message_type_from_string(const std::string& name) {
    if (name == "request") return MessageType::Request;
    if (name == "response") return MessageType::Response;
    if (name == "error") return MessageType::Error;
    if (name == "event") return MessageType::Event;
    return std::nullopt;
}

Message Message::request(json id, std::string method, json params) {
    Message message;
    message.type = MessageType::Request;
    message.id = std::move(id);
    message.method = std::move(method);
    message.params = std::move(params);
    return message;
}

Message Message::event(std::string method, json params) {
    Message message;
    message.type = MessageType::Event;
    message.method = std::move(method);
    message.params = std::move(params);
    return message;
}

Message Message::response(json id, json result) {
    Message message;
    message.type = MessageType::Response;
    message.id = std::move(id);
    message.result = std::move(result);
    return message;
}

Message Message::error_reply(std::optional<json> id, json error) {
    Message message;
    message.type = MessageType::Error;
    message.id = std::move(id);
    message.error = std::move(error);
    return message;
}

json message_to_json(const Message& message) {
    json object = {{"type", to_string(message.type)}};
    if (message.id) {
        object["id"] = *message.id;
    }
    if (message.method) {
        object["method"] = *message.method;
    }
    if (!message.params.is_null()) {
        object["params"] = message.params;
    }
    if (!message.result.is_null()) {
        object["result"] = message.result;
    }
    if (!message.error.is_null()) {
        object["error"] = message.error;
    }
    return object;
}

Message message_from_json(const json& object) {
    if (!object.is_object()) {
        throw ProtocolFramingError("Invalid Request: envelope must be a JSON object");
    }
    if (!object.contains("type") || !object["type"].is_string()) {
        throw ProtocolFramingError("Invalid Request: missing envelope type");
    }

    auto type = message_type_from_string(object["type"].get<std::string>());
    if (!type) {
        throw ProtocolFramingError("Invalid Request: unknown envelope type " + object["type"].dump());
    }

    Message message;
    message.type = *type;
    message.id = read_id(object);
    message.method = read_method(object);
    message.params = object.value("params", json());
    message.result = object.value("result", json());
    message.error = object.value("error", json());

    if (message.type == MessageType::Event && message.id) {
        throw ProtocolFramingError("Invalid Request: event envelopes carry no id");
    }
    return message;
}

json message_to_jsonrpc(const Message& message) {
    json object = {{"jsonrpc", "2.0"}};

    switch (message.type) {
        case MessageType::Request:
            object["method"] = message.method.value_or("");
            if (!message.params.is_null()) {
                object["params"] = message.params;
            }
            object["id"] = message.id.value_or(json());
            break;
        case MessageType::Response:
            object["id"] = message.id.value_or(json());
            object["result"] = message.result;
            break;
        case MessageType::Error:
            object["id"] = message.id.value_or(json());
            object["error"] = message.error;
            break;
        case MessageType::Event:
            object["method"] = message.method.value_or("");
            if (!message.params.is_null()) {
                object["params"] = message.params;
            }
            break;
    }
    return object;
}

Message message_from_jsonrpc(const json& object) {
    if (!object.is_object()) {
        throw ProtocolFramingError("Invalid Request: message must be a JSON object");
    }

    auto id = read_id(object);
    auto method = read_method(object);

    Message message;
    message.id = id;
    message.method = method;

    if (method && id) {
        message.type = MessageType::Request;
        message.params = object.value("params", json::object());
    } else if (method) {
        message.type = MessageType::Event;
        message.params = object.value("params", json::object());
    } else if (object.contains("result") && id) {
        message.type = MessageType::Response;
        message.result = object["result"];
    } else if (object.contains("error") && id) {
        message.type = MessageType::Error;
        message.error = object["error"];
    } else {
        throw ProtocolFramingError("Invalid Request: unrecognized JSON-RPC message shape");
    }
    return message;
}

Message message_from_wire(const json& object) {
    if (object.is_object() && object.contains("type") && object["type"].is_string()) {
        return message_from_json(object);
    }
    return message_from_jsonrpc(object);
}

} // namespace mcpx

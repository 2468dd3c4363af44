#include "Errors.hpp"

namespace mcpx {

json make_error_object(int code, const std::string& message, const json& data) {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return error;
}

json to_error_object(const std::exception& error) {
    if (const auto* mcp_error = dynamic_cast<const McpError*>(&error)) {
        return make_error_object(mcp_error->code(), mcp_error->what(), mcp_error->data());
    }
    return make_error_object(kInternalError, std::string("Internal error: ") + error.what());
}

} // namespace mcpx

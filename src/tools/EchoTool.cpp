#include "EchoTool.hpp"
#include "core/Errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpx {

namespace {

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

} // namespace

ToolInfo EchoTool::get_info() {
    return {
        "echo",
        "Echo back the input message",
        {
            {"type", "object"},
            {"properties", {
                {"message", {
                    {"type", "string"},
                    {"description", "Message to echo back"}
                }}
            }},
            {"required", json::array({"message"})}
        }
    };
}

json EchoTool::execute(const json& args, const ToolContext& context) const {
    if (!args.is_object() || !args.contains("message") || !args["message"].is_string()) {
        throw ValidationError("Parameter 'message' must be a string", {{"field", "message"}});
    }

    const std::string message = args["message"].get<std::string>();
    if (context.logger) {
        context.logger->info("Echo tool called by {}: {}", context.client_id, message);
    }

    return {
        {"original", message},
        {"echoed", message},
        {"timestamp", utc_timestamp()}
    };
}

} // namespace mcpx

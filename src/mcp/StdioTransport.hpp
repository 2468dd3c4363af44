#pragma once

#include "BaseTransport.hpp"
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpx {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads newline-delimited JSON from the input stream and writes one JSON
 * object per line to the output stream. Diagnostics go to the logger, never
 * to the output stream. A single synthetic client ("stdio-client") exists
 * between start() and stop() or end of input.
 *
 * Framing rules:
 * - an unparseable line is logged; if an id can be recovered from the raw
 *   text, one {"id":...,"error":{"code":-32700,"message":"Parse error"}}
 *   line is written
 * - a parsed message holding a newline character in any string is logged
 *   and dropped
 * - send() refuses messages whose frame would hold a newline character and
 *   writes nothing in that case
 */
class StdioTransport : public BaseTransport {
public:
    static constexpr const char* kClientId = "stdio-client";

    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     * @param logger Diagnostic logger (default: spdlog default logger)
     */
    explicit StdioTransport(std::istream& in = std::cin,
                            std::ostream& out = std::cout,
                            std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string name() const override { return "stdio"; }

    void start() override;
    void stop() override;
    void run() override;
    void send(const std::string& client_id, const Message& message) override;

    /**
     * @brief Process one raw input line
     *
     * Exposed so callers driving their own read loop can feed lines.
     */
    void handle_line(std::string line);

private:
    void handle_parse_failure(const std::string& line, const std::string& reason);
    void write_frame(const std::string& frame);
    void close_connection();

    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
};

/**
 * @brief Recover a request id from text that failed to parse
 *
 * Looks for "id": "<string>" first, then "id": <integer>.
 *
 * @return The id as a JSON string or integer, or std::nullopt
 */
std::optional<json> recover_request_id(std::string_view raw);

/**
 * @brief Check whether any string (or object key) in a value holds '\n'
 */
bool contains_newline(const json& value);

} // namespace mcpx

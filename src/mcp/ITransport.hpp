#pragma once

#include "core/Message.hpp"
#include <functional>
#include <string>
#include <vector>

namespace mcpx {

using MessageHandler = std::function<void(const std::string& client_id, const Message& message)>;
using ConnectHandler = std::function<void(const std::string& client_id)>;
using DisconnectHandler = std::function<void(const std::string& client_id)>;

/**
 * @brief Abstract interface for transport mechanisms
 *
 * Implementations own one I/O resource (stream pair, listener) and
 * normalize connect/message/disconnect into uniform events
 * (stdio, HTTP, SSE, ...).
 *
 * Event handlers of one kind run sequentially in registration order and
 * each returns before the next runs and before the transport reads more
 * input from the same connection.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Short transport name ("stdio", "http", ...)
     */
    virtual std::string name() const = 0;

    /**
     * @brief Acquire the I/O resource and begin accepting peers
     *
     * On failure everything acquired so far is released before the
     * exception leaves start().
     *
     * @throws TransportError if already started or acquisition fails
     */
    virtual void start() = 0;

    /**
     * @brief Stop accepting input and release the I/O resource
     *
     * Idempotent. Sends attempted afterwards fail with TransportError.
     */
    virtual void stop() = 0;

    /**
     * @brief Pump inbound events until input is exhausted or stop() is called
     *
     * Blocks the calling thread.
     */
    virtual void run() = 0;

    /**
     * @brief Deliver a message to exactly one connected peer
     * @throws TransportError if not started or the client is unknown
     * @throws ProtocolFramingError if the message cannot be framed
     */
    virtual void send(const std::string& client_id, const Message& message) = 0;

    /**
     * @brief Deliver a message to every peer connected at call time
     *
     * Best effort: a failure for one peer is logged and the rest still
     * receive the message.
     *
     * @throws TransportError if not started
     */
    virtual void broadcast(const Message& message) = 0;

    virtual void on_message(MessageHandler handler) = 0;
    virtual void on_connect(ConnectHandler handler) = 0;
    virtual void on_disconnect(DisconnectHandler handler) = 0;

    virtual bool is_started() const = 0;

    /**
     * @brief Snapshot of currently connected client ids
     */
    virtual std::vector<std::string> clients() const = 0;
};

} // namespace mcpx

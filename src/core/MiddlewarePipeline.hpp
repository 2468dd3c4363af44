#pragma once

#include "core/Message.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcpx {

/**
 * @brief Per-message state shared by every stage of one dispatch
 *
 * Allocated once per inbound message by the dispatcher and passed by
 * reference through the whole chain. Never shared between messages.
 */
struct MiddlewareContext {
    std::string client_id;
    std::shared_ptr<spdlog::logger> logger;
    json metadata = json::object();
};

/**
 * @brief Continuation handed to a middleware
 *
 * Calling it runs the remaining stages (and finally the terminal step)
 * and returns once all of them have completed. Errors thrown downstream
 * propagate out of the call.
 */
using Next = std::function<void()>;

/**
 * @brief Middleware stage signature
 *
 * A handler may work before next(), after it returns, or never call it
 * (short-circuit). Throwing aborts the whole chain.
 */
using MiddlewareHandler = std::function<void(const Message& message, MiddlewareContext& context, const Next& next)>;

/**
 * @brief Registry entry for one middleware stage
 */
struct Middleware {
    std::string name;
    int priority = 0;
    MiddlewareHandler handler;
};

/**
 * @brief Priority-ordered, fail-fast middleware chain
 *
 * Entries run in descending priority; equal priorities keep registration
 * order. Adding an entry whose name already exists replaces the old entry,
 * and the replacement counts as a new registration for tie-breaking.
 */
class MiddlewarePipeline {
public:
    /// Upper bound on chain length; the invoker recurses once per stage.
    static constexpr std::size_t kMaxChainLength = 256;

    explicit MiddlewarePipeline(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Register (or replace) a middleware
     * @throws std::invalid_argument on empty name or null handler
     * @throws std::length_error when kMaxChainLength would be exceeded
     */
    void add(Middleware middleware);

    /**
     * @brief Remove a middleware by name
     * @return true if an entry was removed
     */
    bool remove(const std::string& name);

    /**
     * @brief Names in effective execution order
     */
    std::vector<std::string> names() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    /**
     * @brief Run the chain for one message
     *
     * The chain is built over a snapshot of the entries taken at call time,
     * so registrations made while a message is in flight apply from the
     * next message on.
     *
     * @param message Inbound envelope
     * @param context Per-message context, shared by reference with every stage
     * @param terminal Step run after the last middleware calls next()
     * @throws Whatever a stage or the terminal step throws, unchanged
     */
    void run(const Message& message, MiddlewareContext& context, const std::function<void()>& terminal) const;

private:
    struct Entry {
        Middleware middleware;
        std::uint64_t sequence;
    };

    static void invoke(const std::vector<Entry>& chain,
                       std::size_t index,
                       const Message& message,
                       MiddlewareContext& context,
                       const std::function<void()>& terminal);

    std::vector<Entry> entries_;
    std::uint64_t next_sequence_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcpx

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpx {

using json = nlohmann::json;

/**
 * @brief Lifecycle points at which hooks fire
 */
enum class HookPhase {
    OnStart,
    OnStop,
    OnClientConnect,
    OnClientDisconnect,
    BeforeToolExecution,
    AfterToolExecution
};

constexpr std::size_t kHookPhaseCount = 6;

/**
 * @brief Wire-style name of a phase ("onStart", "beforeToolExecution", ...)
 */
const char* to_string(HookPhase phase);

std::optional<HookPhase> hook_phase_from_string(const std::string& name);

/**
 * @brief Data handed to a hook handler
 */
struct HookContext {
    HookPhase phase = HookPhase::OnStart;
    std::string event;
    std::optional<std::string> client_id;
    std::optional<std::string> tool_name;
    json data;
};

using HookHandler = std::function<void(const HookContext& context)>;

/**
 * @brief Registry entry for one lifecycle hook
 */
struct Hook {
    std::string name;
    HookPhase phase = HookPhase::OnStart;
    HookHandler handler;
};

/**
 * @brief Phase-keyed, fail-isolated lifecycle hooks
 *
 * Handlers of a phase run in registration order. A throwing handler is
 * logged and skipped; its siblings still run and the triggering operation
 * never sees the error.
 */
class HookRegistry {
public:
    explicit HookRegistry(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Register a hook
     * @throws std::invalid_argument on empty name or null handler
     */
    void add(Hook hook);

    /**
     * @brief Number of hooks registered for a phase
     */
    std::size_t count(HookPhase phase) const;

    /**
     * @brief Names registered for a phase, in firing order
     */
    std::vector<std::string> names(HookPhase phase) const;

    /**
     * @brief Run every handler of a phase
     *
     * context.phase and context.event are set from @p phase.
     *
     * @return Number of handlers that failed
     */
    std::size_t fire(HookPhase phase, HookContext context = {}) const;

    void clear();

private:
    std::array<std::vector<Hook>, kHookPhaseCount> hooks_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcpx

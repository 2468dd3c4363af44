#include "HookRegistry.hpp"
#include <stdexcept>

namespace mcpx {

namespace {

std::size_t index_of(HookPhase phase) {
    return static_cast<std::size_t>(phase);
}

} // namespace

const char* to_string(HookPhase phase) {
    switch (phase) {
        case HookPhase::OnStart:             return "onStart";
        case HookPhase::OnStop:              return "onStop";
        case HookPhase::OnClientConnect:     return "onClientConnect";
        case HookPhase::OnClientDisconnect:  return "onClientDisconnect";
        case HookPhase::BeforeToolExecution: return "beforeToolExecution";
        case HookPhase::AfterToolExecution:  return "afterToolExecution";
    }
    return "onStart";
}

std::optional<HookPhase> hook_phase_from_string(const std::string& name) {
    for (std::size_t i = 0; i < kHookPhaseCount; ++i) {
        auto phase = static_cast<HookPhase>(i);
        if (name == to_string(phase)) {
            return phase;
        }
    }
    return std::nullopt;
}

HookRegistry::HookRegistry(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void HookRegistry::add(Hook hook) {
    if (hook.name.empty()) {
        throw std::invalid_argument("Hook name cannot be empty");
    }
    if (!hook.handler) {
        throw std::invalid_argument("Hook handler cannot be null");
    }

    logger_->debug("Registered hook: {} for phase {}", hook.name, to_string(hook.phase));
    hooks_[index_of(hook.phase)].push_back(std::move(hook));
}

std::size_t HookRegistry::count(HookPhase phase) const {
    return hooks_[index_of(phase)].size();
}

std::vector<std::string> HookRegistry::names(HookPhase phase) const {
    std::vector<std::string> result;
    for (const auto& hook : hooks_[index_of(phase)]) {
        result.push_back(hook.name);
    }
    return result;
}

std::size_t HookRegistry::fire(HookPhase phase, HookContext context) const {
    context.phase = phase;
    context.event = to_string(phase);

    // Copy so a handler registering further hooks does not invalidate iteration
    const std::vector<Hook> hooks = hooks_[index_of(phase)];
    std::size_t failures = 0;

    for (const auto& hook : hooks) {
        try {
            hook.handler(context);
        } catch (const std::exception& e) {
            ++failures;
            logger_->error("Hook execution failed: {} ({}): {}", hook.name, context.event, e.what());
        } catch (...) {
            ++failures;
            logger_->error("Hook execution failed: {} ({}): non-standard exception", hook.name, context.event);
        }
    }
    return failures;
}

void HookRegistry::clear() {
    for (auto& hooks : hooks_) {
        hooks.clear();
    }
}

} // namespace mcpx

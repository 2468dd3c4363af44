#include "MiddlewarePipeline.hpp"
#include <algorithm>
#include <stdexcept>

namespace mcpx {

MiddlewarePipeline::MiddlewarePipeline(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void MiddlewarePipeline::add(Middleware middleware) {
    if (middleware.name.empty()) {
        throw std::invalid_argument("Middleware name cannot be empty");
    }
    if (!middleware.handler) {
        throw std::invalid_argument("Middleware handler cannot be null");
    }

    bool replaced = remove(middleware.name);
    if (replaced) {
        logger_->warn("Middleware '{}' is already registered, overwriting", middleware.name);
    }

    if (entries_.size() >= kMaxChainLength) {
        throw std::length_error("Middleware chain is limited to " +
                                std::to_string(kMaxChainLength) + " entries");
    }

    logger_->debug("Registered middleware: {} (priority {})", middleware.name, middleware.priority);
    entries_.push_back(Entry{std::move(middleware), next_sequence_++});

    std::sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        if (a.middleware.priority != b.middleware.priority) {
            return a.middleware.priority > b.middleware.priority;
        }
        return a.sequence < b.sequence;
    });
}

bool MiddlewarePipeline::remove(const std::string& name) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const Entry& entry) {
        return entry.middleware.name == name;
    });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::string> MiddlewarePipeline::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.middleware.name);
    }
    return result;
}

void MiddlewarePipeline::clear() {
    entries_.clear();
}

void MiddlewarePipeline::run(const Message& message,
                             MiddlewareContext& context,
                             const std::function<void()>& terminal) const {
    const std::vector<Entry> chain = entries_;
    invoke(chain, 0, message, context, terminal);
}

void MiddlewarePipeline::invoke(const std::vector<Entry>& chain,
                                std::size_t index,
                                const Message& message,
                                MiddlewareContext& context,
                                const std::function<void()>& terminal) {
    if (index >= chain.size()) {
        if (terminal) {
            terminal();
        }
        return;
    }

    const Middleware& stage = chain[index].middleware;
    bool called = false;
    Next next = [&chain, index, &message, &context, &terminal, &called, &stage]() {
        if (called) {
            throw std::logic_error("next() called multiple times by middleware '" + stage.name + "'");
        }
        called = true;
        invoke(chain, index + 1, message, context, terminal);
    };

    stage.handler(message, context, next);
}

} // namespace mcpx

#include "PluginManager.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace mcpx {

PluginManager::PluginManager(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void PluginManager::register_plugin(std::shared_ptr<IPlugin> plugin) {
    if (!plugin) {
        throw std::invalid_argument("Plugin cannot be null");
    }
    const std::string name = plugin->name();
    if (name.empty()) {
        throw std::invalid_argument("Plugin name cannot be empty");
    }

    if (plugins_.count(name) > 0) {
        logger_->warn("Plugin '{}' is already registered, overwriting", name);
    } else {
        registration_order_.push_back(name);
    }

    plugins_[name] = plugin;
    logger_->info("Plugin registered: {} v{}", name, plugin->version());
}

void PluginManager::load(const std::string& name, IServerHandle& server) {
    auto plugin = get(name);
    if (!plugin) {
        throw PluginLifecycleError("Plugin not found: " + name);
    }

    if (is_loaded(name)) {
        logger_->warn("Plugin '{}' is already loaded", name);
        return;
    }

    logger_->info("Loading plugin: {} v{}", name, plugin->version());
    try {
        plugin->initialize(server);
    } catch (const std::exception& e) {
        logger_->error("Failed to load plugin {}: {}", name, e.what());
        throw;
    }

    load_order_.push_back(name);
    logger_->info("Plugin loaded successfully: {}", name);
}

void PluginManager::load_all(IServerHandle& server) {
    for (const auto& plugin : effective_order()) {
        load(plugin->name(), server);
    }
}

void PluginManager::unload(const std::string& name) {
    auto plugin = get(name);
    if (!plugin) {
        throw PluginLifecycleError("Plugin not found: " + name);
    }
    if (!is_loaded(name)) {
        throw PluginLifecycleError("Plugin is not loaded: " + name);
    }

    logger_->info("Unloading plugin: {}", name);
    try {
        plugin->cleanup();
    } catch (const std::exception& e) {
        logger_->error("Failed to unload plugin {}: {}", name, e.what());
        throw;
    }

    load_order_.erase(std::remove(load_order_.begin(), load_order_.end(), name), load_order_.end());
    logger_->info("Plugin unloaded: {}", name);
}

void PluginManager::unload_all() {
    const std::vector<std::string> snapshot(load_order_.rbegin(), load_order_.rend());

    for (const auto& name : snapshot) {
        if (is_loaded(name)) {
            unload(name);
        }
    }
}

std::shared_ptr<IPlugin> PluginManager::get(const std::string& name) const {
    auto it = plugins_.find(name);
    return it == plugins_.end() ? nullptr : it->second;
}

bool PluginManager::is_registered(const std::string& name) const {
    return plugins_.count(name) > 0;
}

bool PluginManager::is_loaded(const std::string& name) const {
    return std::find(load_order_.begin(), load_order_.end(), name) != load_order_.end();
}

std::vector<PluginInfo> PluginManager::list() const {
    std::vector<PluginInfo> result;
    for (const auto& plugin : effective_order()) {
        result.push_back({plugin->name(), plugin->version(), plugin->priority(), is_loaded(plugin->name())});
    }
    return result;
}

void PluginManager::clear() {
    plugins_.clear();
    registration_order_.clear();
    load_order_.clear();
}

std::vector<std::shared_ptr<IPlugin>> PluginManager::effective_order() const {
    std::vector<std::shared_ptr<IPlugin>> ordered;
    ordered.reserve(registration_order_.size());
    for (const auto& name : registration_order_) {
        ordered.push_back(plugins_.at(name));
    }

    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a->priority() > b->priority();
    });
    return ordered;
}

} // namespace mcpx

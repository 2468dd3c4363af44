#pragma once

#include "plugins/IPlugin.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpx {

class IServerHandle;

/**
 * @brief Summary of a registered plugin
 */
struct PluginInfo {
    std::string name;
    std::string version;
    int priority = 0;
    bool loaded = false;
};

/**
 * @brief Owns plugins and drives their load/unload lifecycle
 *
 * Tracks the registered plugins and the subset that is loaded. Load order
 * is descending priority with ties in registration order; unload_all()
 * tears down in reverse load order.
 */
class PluginManager {
public:
    explicit PluginManager(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Register a plugin, replacing any plugin with the same name
     *
     * A replaced plugin keeps its registration slot and loaded flag.
     *
     * @throws std::invalid_argument on null plugin or empty name
     */
    void register_plugin(std::shared_ptr<IPlugin> plugin);

    /**
     * @brief Initialize one plugin
     *
     * No-op (with a warning) if already loaded. The plugin is marked
     * loaded only after initialize() returns.
     *
     * @throws PluginLifecycleError if the plugin is unknown
     * @throws Whatever initialize() throws
     */
    void load(const std::string& name, IServerHandle& server);

    /**
     * @brief Load every registered plugin in effective order
     *
     * Stops at the first failure; plugins loaded before it stay loaded.
     */
    void load_all(IServerHandle& server);

    /**
     * @brief Clean up one loaded plugin
     *
     * The plugin leaves the loaded set only if cleanup() returns normally.
     *
     * @throws PluginLifecycleError if unknown or not loaded
     * @throws Whatever cleanup() throws
     */
    void unload(const std::string& name);

    /**
     * @brief Unload every plugin loaded at call time, most recent first
     *
     * Plugins loaded while this runs are not visited. Stops at the first
     * failure.
     */
    void unload_all();

    std::shared_ptr<IPlugin> get(const std::string& name) const;
    bool is_registered(const std::string& name) const;
    bool is_loaded(const std::string& name) const;

    /**
     * @brief Registered plugins in effective load order
     */
    std::vector<PluginInfo> list() const;

    /**
     * @brief Names of loaded plugins in load order
     */
    std::vector<std::string> loaded() const { return load_order_; }

    /**
     * @brief Forget every plugin without calling cleanup()
     */
    void clear();

private:
    std::vector<std::shared_ptr<IPlugin>> effective_order() const;

    std::map<std::string, std::shared_ptr<IPlugin>> plugins_;
    std::vector<std::string> registration_order_;
    std::vector<std::string> load_order_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcpx

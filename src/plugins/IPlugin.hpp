#pragma once

#include <functional>
#include <string>

namespace mcpx {

class IServerHandle;

/**
 * @brief Capability interface for plugins
 *
 * initialize() is required; cleanup() is optional and does nothing unless
 * overridden. Higher priority plugins load first.
 */
class IPlugin {
public:
    virtual ~IPlugin() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;
    virtual int priority() const { return 0; }

    /**
     * @brief Register tools, middleware and hooks with the server
     * @throws Any exception to abort loading; the plugin stays unloaded
     */
    virtual void initialize(IServerHandle& server) = 0;

    /**
     * @brief Release plugin resources
     * @throws Any exception to abort unloading; the plugin stays loaded
     */
    virtual void cleanup() {}
};

/**
 * @brief Plugin assembled from callables, for plugins without their own class
 */
class FunctionPlugin : public IPlugin {
public:
    using InitializeFn = std::function<void(IServerHandle&)>;
    using CleanupFn = std::function<void()>;

    FunctionPlugin(std::string name,
                   std::string version,
                   int priority,
                   InitializeFn initialize,
                   CleanupFn cleanup = {})
        : name_(std::move(name)),
          version_(std::move(version)),
          priority_(priority),
          initialize_(std::move(initialize)),
          cleanup_(std::move(cleanup)) {}

    std::string name() const override { return name_; }
    std::string version() const override { return version_; }
    int priority() const override { return priority_; }

    void initialize(IServerHandle& server) override {
        if (initialize_) {
            initialize_(server);
        }
    }

    void cleanup() override {
        if (cleanup_) {
            cleanup_();
        }
    }

private:
    std::string name_;
    std::string version_;
    int priority_;
    InitializeFn initialize_;
    CleanupFn cleanup_;
};

} // namespace mcpx

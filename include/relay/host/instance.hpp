/// @file instance.hpp
/// @brief One running bot instance and the scripts loaded into it

#pragma once

#include "config.hpp"
#include "script.hpp"

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>
#include <relay/exec/execution_queue.hpp>
#include <relay/kernel/capability_registry.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relay_host {

class Host;

/// A bot instance: an execution queue plus the scripts loaded on it.
///
/// Loading checks everything that can be checked before script code runs
/// (catalog entry, manifest, backend, declared modules); a failed check
/// creates nothing. setup() then runs on the instance queue. Unloading
/// delivers `unload` to the script and tears the context down after it.
class Instance {
public:
    Instance(Host& host, InstanceConfig config, std::shared_ptr<relay_exec::ExecutionQueue> queue);
    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    /// Create the instance queue and attach it to the event bus.
    /// Failing to create the queue is the only fatal instance error.
    [[nodiscard]] static relay_core::Result<std::unique_ptr<Instance>> create(Host& host, InstanceConfig config);

    [[nodiscard]] const std::string& id() const { return m_config.id; }
    [[nodiscard]] const std::string& backend() const { return m_config.backend; }
    [[nodiscard]] const InstanceConfig& config() const { return m_config; }
    [[nodiscard]] const std::shared_ptr<relay_exec::ExecutionQueue>& queue() const { return m_queue; }
    [[nodiscard]] bool is_running() const { return m_running.load(); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Load the configured scripts; a script that fails to load is logged
    /// and skipped
    /// @return number of scripts loaded
    std::size_t start();

    /// Unload every script, wait for the queue and detach from the bus
    void stop();

    // =========================================================================
    // Scripts
    // =========================================================================

    /// Load a script with the configuration from the instance config
    [[nodiscard]] relay_core::Result<relay_kernel::ContextId> load_script(const std::string& name);

    /// Load a script with an explicit configuration
    [[nodiscard]] relay_core::Result<relay_kernel::ContextId> load_script(const std::string& name,
                                                                          const relay_core::Value& config);

    /// Deliver `unload` to the script, then release its subscriptions and
    /// connections on the queue
    [[nodiscard]] relay_core::Result<void> unload_script(const std::string& name);

    /// Unload all scripts and load the configured ones again. Runs on the
    /// queue after every task already posted; safe to call from a script.
    [[nodiscard]] relay_core::Result<void> reload();

    [[nodiscard]] bool is_loaded(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> loaded_scripts() const;

    /// Context of a loaded script, or nullptr
    [[nodiscard]] std::shared_ptr<relay_kernel::ScriptContext> context(const std::string& name) const;

    /// Wait for every task posted so far (host side only)
    [[nodiscard]] relay_core::Result<void> flush(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    // =========================================================================
    // Backend Adapter
    // =========================================================================

    /// Host-origin event from the voice backend to this instance's scripts
    [[nodiscard]] relay_core::Result<void> dispatch_backend_event(const std::string& name, relay_core::Value payload);

    // =========================================================================
    // Logging
    // =========================================================================

    [[nodiscard]] int log_level() const { return m_log_level.load(); }

    /// @return false if the level is outside 0..11
    bool set_log_level(int level);

    /// Logger behind engine.log(), named "script:<instance>"
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& script_logger() const { return m_logger; }

private:
    struct LoadedScript {
        std::shared_ptr<IScript> script;
        std::shared_ptr<relay_kernel::ScriptContext> context;
    };

    /// Run setup on the queue and wait for it unless already on the queue
    relay_core::Result<void> run_setup(const LoadedScript& loaded, const relay_core::Value& config);

    /// Post unload delivery and teardown for one script
    void post_unload(LoadedScript loaded);

    /// Release everything a context owns
    void teardown(relay_kernel::ScriptContext& context);

    Host& m_host;
    InstanceConfig m_config;
    std::shared_ptr<relay_exec::ExecutionQueue> m_queue;
    std::shared_ptr<spdlog::logger> m_logger;
    std::atomic<int> m_log_level;
    std::atomic<bool> m_running{false};

    mutable std::mutex m_mutex;
    std::map<std::string, LoadedScript> m_scripts;
};

} // namespace relay_host

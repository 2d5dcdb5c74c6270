/// @file config.hpp
/// @brief Host configuration loaded from JSON

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>
#include <relay/core/value.hpp>
#include <relay/kernel/privileges.hpp>
#include <relay/net/types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace relay_host {

/// One bot instance to start
struct InstanceConfig {
    std::string id;
    std::string backend = "ts3";
    int log_level = 3;
    std::vector<std::string> scripts;
    relay_core::Value script_config = relay_core::Value::object();  ///< script name -> config object

    /// Configuration object for one script (empty object if absent)
    [[nodiscard]] relay_core::Value config_for(const std::string& script) const;
};

/// Listener for websocket peers; the request path `/<instance>/<script>`
/// picks the owning script
struct WebConfig {
    bool enabled = false;
    std::string address = "127.0.0.1";
    std::uint16_t port = 8087;
};

/// Whole-process configuration
struct HostConfig {
    std::string bot_id = "relay";
    std::size_t exec_workers = 4;
    relay_net::SessionConfig net;
    std::string store_backend = "memory";  ///< "memory" or "file"
    std::string store_path = "data/store.json";
    relay_core::LogConfig log;
    bool allow_reload = true;
    relay_kernel::PrivilegeTable privileges;
    WebConfig web;
    std::vector<InstanceConfig> instances;

    /// Parse a configuration object; missing fields keep their defaults
    [[nodiscard]] static relay_core::Result<HostConfig> from_json(const relay_core::Value& j);

    /// Read and parse a configuration file
    [[nodiscard]] static relay_core::Result<HostConfig> load_file(const std::string& path);
};

} // namespace relay_host

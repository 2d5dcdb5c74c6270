/// @file config.cpp
/// @brief Host configuration parsing

#include <relay/host/config.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace relay_host {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::ValidationError;
using relay_core::Value;

namespace {

/// Field lookup that treats null as absent
const Value* field(const Value& j, const char* key) {
    if (!j.is_object()) {
        return nullptr;
    }
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

Result<void> read_string(const Value& j, const char* key, const std::string& path, std::string& out) {
    auto* v = field(j, key);
    if (!v) {
        return Ok();
    }
    if (!v->is_string()) {
        return Err(ValidationError::invalid_config(path, "expected a string"));
    }
    out = v->get<std::string>();
    return Ok();
}

Result<void> read_bool(const Value& j, const char* key, const std::string& path, bool& out) {
    auto* v = field(j, key);
    if (!v) {
        return Ok();
    }
    if (!v->is_boolean()) {
        return Err(ValidationError::invalid_config(path, "expected a boolean"));
    }
    out = v->get<bool>();
    return Ok();
}

Result<void> read_int(const Value& j, const char* key, const std::string& path,
                      std::int64_t min, std::int64_t max, std::int64_t& out) {
    auto* v = field(j, key);
    if (!v) {
        return Ok();
    }
    if (!v->is_number_integer()) {
        return Err(ValidationError::invalid_config(path, "expected an integer"));
    }
    auto n = v->get<std::int64_t>();
    if (n < min || n > max) {
        return Err(ValidationError::invalid_config(path,
            "must be within " + std::to_string(min) + ".." + std::to_string(max)));
    }
    out = n;
    return Ok();
}

Result<void> parse_exec(const Value& j, HostConfig& config) {
    auto workers = static_cast<std::int64_t>(config.exec_workers);
    if (auto r = read_int(j, "workers", "exec.workers", 1, 256, workers); !r) return r;
    config.exec_workers = static_cast<std::size_t>(workers);
    return Ok();
}

Result<void> parse_net(const Value& j, HostConfig& config) {
    auto threads = static_cast<std::int64_t>(config.net.io_threads);
    auto timeout = static_cast<std::int64_t>(config.net.connect_timeout.count());
    auto buffer = static_cast<std::int64_t>(config.net.read_buffer_size);
    if (auto r = read_int(j, "io_threads", "net.io_threads", 1, 64, threads); !r) return r;
    if (auto r = read_int(j, "connect_timeout_ms", "net.connect_timeout_ms", 1, 600000, timeout); !r) return r;
    if (auto r = read_int(j, "read_buffer_size", "net.read_buffer_size", 256, 1 << 20, buffer); !r) return r;
    config.net.io_threads = static_cast<std::size_t>(threads);
    config.net.connect_timeout = std::chrono::milliseconds(timeout);
    config.net.read_buffer_size = static_cast<std::size_t>(buffer);
    return Ok();
}

Result<void> parse_store(const Value& j, HostConfig& config) {
    if (auto r = read_string(j, "backend", "store.backend", config.store_backend); !r) return r;
    if (auto r = read_string(j, "path", "store.path", config.store_path); !r) return r;
    if (config.store_backend != "memory" && config.store_backend != "file") {
        return Err(ValidationError::invalid_config("store.backend", "expected \"memory\" or \"file\""));
    }
    if (config.store_backend == "file" && config.store_path.empty()) {
        return Err(ValidationError::invalid_config("store.path", "required for the file backend"));
    }
    return Ok();
}

Result<void> parse_log(const Value& j, HostConfig& config) {
    std::string level;
    if (auto r = read_string(j, "level", "log.level", level); !r) return r;
    if (!level.empty()) {
        auto parsed = relay_core::parse_log_level(level);
        if (!parsed) {
            return Err(ValidationError::invalid_config("log.level", "unknown level '" + level + "'"));
        }
        config.log.level = *parsed;
    }
    if (auto r = read_bool(j, "console", "log.console", config.log.console_enabled); !r) return r;
    if (auto r = read_bool(j, "file", "log.file", config.log.file_enabled); !r) return r;
    if (auto r = read_string(j, "directory", "log.directory", config.log.log_directory); !r) return r;
    if (config.log.file_enabled && config.log.log_directory.empty()) {
        config.log.log_directory = "logs";
    }
    return Ok();
}

Result<void> parse_web(const Value& j, HostConfig& config) {
    std::int64_t port = config.web.port;
    if (auto r = read_bool(j, "enabled", "web.enabled", config.web.enabled); !r) return r;
    if (auto r = read_string(j, "address", "web.address", config.web.address); !r) return r;
    if (auto r = read_int(j, "port", "web.port", 0, 65535, port); !r) return r;
    config.web.port = static_cast<std::uint16_t>(port);
    return Ok();
}

Result<InstanceConfig> parse_instance(const Value& j, std::size_t index) {
    auto path = "instances[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        return Err<InstanceConfig>(ValidationError::invalid_config(path, "expected an object"));
    }

    InstanceConfig instance;
    std::int64_t level = instance.log_level;
    if (auto r = read_string(j, "id", path + ".id", instance.id); !r) return Err<InstanceConfig>(r.error());
    if (auto r = read_string(j, "backend", path + ".backend", instance.backend); !r) return Err<InstanceConfig>(r.error());
    if (auto r = read_int(j, "log_level", path + ".log_level", 0, 11, level); !r) return Err<InstanceConfig>(r.error());
    instance.log_level = static_cast<int>(level);

    if (instance.id.empty()) {
        return Err<InstanceConfig>(ValidationError::invalid_config(path + ".id", "required"));
    }
    if (instance.backend.empty()) {
        return Err<InstanceConfig>(ValidationError::invalid_config(path + ".backend", "must not be empty"));
    }

    if (auto* scripts = field(j, "scripts")) {
        if (!scripts->is_array()) {
            return Err<InstanceConfig>(ValidationError::invalid_config(path + ".scripts", "expected an array of names"));
        }
        for (const auto& name : *scripts) {
            if (!name.is_string()) {
                return Err<InstanceConfig>(ValidationError::invalid_config(path + ".scripts", "expected an array of names"));
            }
            instance.scripts.push_back(name.get<std::string>());
        }
    }

    if (auto* script_config = field(j, "script_config")) {
        if (!script_config->is_object()) {
            return Err<InstanceConfig>(ValidationError::invalid_config(path + ".script_config", "expected an object"));
        }
        for (const auto& [name, cfg] : script_config->items()) {
            if (!cfg.is_object()) {
                return Err<InstanceConfig>(ValidationError::invalid_config(
                    path + ".script_config." + name, "expected an object"));
            }
        }
        instance.script_config = *script_config;
    }

    return instance;
}

} // anonymous namespace

Value InstanceConfig::config_for(const std::string& script) const {
    auto it = script_config.find(script);
    if (it == script_config.end() || !it->is_object()) {
        return Value::object();
    }
    return *it;
}

// =============================================================================
// HostConfig
// =============================================================================

Result<HostConfig> HostConfig::from_json(const Value& j) {
    if (!j.is_object()) {
        return Err<HostConfig>(ValidationError::invalid_config("config", "expected an object"));
    }

    HostConfig config;
    if (auto r = read_string(j, "bot_id", "bot_id", config.bot_id); !r) return Err<HostConfig>(r.error());
    if (auto r = read_bool(j, "allow_reload", "allow_reload", config.allow_reload); !r) return Err<HostConfig>(r.error());

    if (auto* v = field(j, "exec")) {
        if (auto r = parse_exec(*v, config); !r) return Err<HostConfig>(r.error());
    }
    if (auto* v = field(j, "net")) {
        if (auto r = parse_net(*v, config); !r) return Err<HostConfig>(r.error());
    }
    if (auto* v = field(j, "store")) {
        if (auto r = parse_store(*v, config); !r) return Err<HostConfig>(r.error());
    }
    if (auto* v = field(j, "log")) {
        if (auto r = parse_log(*v, config); !r) return Err<HostConfig>(r.error());
    }
    if (auto* v = field(j, "web")) {
        if (auto r = parse_web(*v, config); !r) return Err<HostConfig>(r.error());
    }

    if (auto* v = field(j, "privileges")) {
        auto table = relay_kernel::PrivilegeTable::from_json(*v);
        if (!table) {
            return Err<HostConfig>(table.error());
        }
        config.privileges = std::move(table).value();
    }

    if (auto* v = field(j, "instances")) {
        if (!v->is_array()) {
            return Err<HostConfig>(ValidationError::invalid_config("instances", "expected an array"));
        }
        std::set<std::string> seen;
        for (std::size_t i = 0; i < v->size(); ++i) {
            auto instance = parse_instance((*v)[i], i);
            if (!instance) {
                return Err<HostConfig>(instance.error());
            }
            if (!seen.insert(instance.value().id).second) {
                return Err<HostConfig>(ValidationError::invalid_config(
                    "instances[" + std::to_string(i) + "].id", "duplicate instance id '" + instance.value().id + "'"));
            }
            config.instances.push_back(std::move(instance).value());
        }
    }

    return config;
}

Result<HostConfig> HostConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<HostConfig>(Error(ErrorCode::NotFound, "Cannot open config file: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Value j = Value::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        return Err<HostConfig>(Error(ErrorCode::ParseError, "Config file is not valid JSON: " + path));
    }

    auto config = from_json(j);
    if (!config) {
        config.error().with_context("file", path);
    }
    return config;
}

} // namespace relay_host

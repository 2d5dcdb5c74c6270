/// @file manifest.cpp
/// @brief Script manifest parsing and validation

#include <relay/kernel/manifest.hpp>
#include <relay/core/version.hpp>

#include <algorithm>
#include <set>

namespace relay_kernel {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;
using relay_core::ValidationError;
using relay_core::Value;

namespace {

Result<void> read_string(const Value& j, const char* key, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return Ok();
    }
    if (!j[key].is_string()) {
        return Err(ValidationError::invalid_manifest(key, "expected a string"));
    }
    out = j[key].get<std::string>();
    return Ok();
}

Result<void> read_bool(const Value& j, const char* key, bool& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return Ok();
    }
    if (!j[key].is_boolean()) {
        return Err(ValidationError::invalid_manifest(key, "expected a boolean"));
    }
    out = j[key].get<bool>();
    return Ok();
}

Result<void> read_string_list(const Value& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return Ok();
    }
    if (!j[key].is_array()) {
        return Err(ValidationError::invalid_manifest(key, "expected an array of strings"));
    }
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return Err(ValidationError::invalid_manifest(key, "expected an array of strings"));
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return Ok();
}

} // anonymous namespace

// =============================================================================
// ManifestVar
// =============================================================================

Result<ManifestVar> ManifestVar::from_json(const Value& j) {
    if (!j.is_object()) {
        return Err<ManifestVar>(ValidationError::invalid_manifest("vars", "entries must be objects"));
    }

    ManifestVar var;
    if (auto r = read_string(j, "name", var.name); !r) return Err<ManifestVar>(r.error());
    if (auto r = read_string(j, "title", var.title); !r) return Err<ManifestVar>(r.error());
    if (auto r = read_string(j, "type", var.type); !r) return Err<ManifestVar>(r.error());

    if (j.contains("options")) {
        const auto& options = j["options"];
        if (!options.is_array()) {
            return Err<ManifestVar>(ValidationError::invalid_manifest("options", "expected an array"));
        }
        for (const auto& option : options) {
            var.options.push_back(option.is_string() ? option.get<std::string>() : option.dump());
        }
    }

    if (j.contains("default")) {
        var.default_value = j["default"];
    }

    return var;
}

Value ManifestVar::to_json() const {
    Value j = Value::object();
    j["name"] = name;
    j["title"] = title;
    j["type"] = type;
    if (!default_value.is_null()) {
        j["default"] = default_value;
    }
    if (!options.empty()) {
        j["options"] = options;
    }
    return j;
}

// =============================================================================
// Manifest Parsing
// =============================================================================

Result<Manifest> Manifest::from_json(const Value& j) {
    if (!j.is_object()) {
        return Err<Manifest>(ValidationError::invalid_manifest("manifest", "expected an object"));
    }

    Manifest m;
    if (auto r = read_string(j, "name", m.name); !r) return Err<Manifest>(r.error());
    if (auto r = read_string(j, "version", m.version); !r) return Err<Manifest>(r.error());
    if (auto r = read_string(j, "author", m.author); !r) return Err<Manifest>(r.error());
    if (auto r = read_string(j, "description", m.description); !r) return Err<Manifest>(r.error());
    if (auto r = read_string(j, "engine", m.engine); !r) return Err<Manifest>(r.error());
    if (auto r = read_bool(j, "autorun", m.autorun); !r) return Err<Manifest>(r.error());
    if (auto r = read_bool(j, "hidden", m.hidden); !r) return Err<Manifest>(r.error());
    if (auto r = read_bool(j, "enableWeb", m.enable_web); !r) return Err<Manifest>(r.error());
    if (auto r = read_string_list(j, "backends", m.backends); !r) return Err<Manifest>(r.error());
    if (auto r = read_string_list(j, "requiredModules", m.required_modules); !r) return Err<Manifest>(r.error());
    if (auto r = read_string_list(j, "voiceCommands", m.voice_commands); !r) return Err<Manifest>(r.error());

    if (j.contains("vars") && !j["vars"].is_null()) {
        if (!j["vars"].is_array()) {
            return Err<Manifest>(ValidationError::invalid_manifest("vars", "expected an array"));
        }
        for (const auto& entry : j["vars"]) {
            auto var = ManifestVar::from_json(entry);
            if (!var) {
                return Err<Manifest>(var.error());
            }
            m.vars.push_back(std::move(var).value());
        }
    }

    return m;
}

Result<Manifest> Manifest::from_json_string(const std::string& text) {
    Value j;
    try {
        j = Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<Manifest>(Error(ErrorCode::ParseError,
            std::string("Manifest JSON parse error: ") + e.what()));
    }
    return from_json(j);
}

// =============================================================================
// Validation
// =============================================================================

Result<void> Manifest::validate() const {
    if (name.empty()) {
        return Err(ValidationError::invalid_manifest("name", "is required"));
    }
    if (version.empty()) {
        return Err(ValidationError::invalid_manifest("version", "is required"));
    }
    if (hidden && !vars.empty()) {
        return Err(ValidationError::invalid_manifest("vars",
            "hidden scripts cannot declare variables"));
    }
    if (backends.empty()) {
        return Err(ValidationError::invalid_manifest("backends", "must list at least one backend"));
    }

    std::set<std::string> seen;
    for (const auto& var : vars) {
        if (var.name.empty()) {
            return Err(ValidationError::invalid_manifest("vars", "variable without a name"));
        }
        if (!seen.insert(var.name).second) {
            return Err(ValidationError::invalid_manifest("vars", "duplicate variable '" + var.name + "'"));
        }
    }

    if (!engine.empty()) {
        auto range = relay_core::parse_version_range(engine);
        if (!range) {
            return Err(ValidationError::invalid_manifest("engine", range.error().message()));
        }
        auto running = relay_core::relay_version();
        if (!range->contains(running)) {
            return Err(Error(ErrorCode::IncompatibleVersion,
                "Script '" + name + "' requires engine " + engine + ", running " + running.to_string())
                .with_context("script", name));
        }
    }

    return Ok();
}

bool Manifest::supports_backend(const std::string& backend) const {
    return std::find(backends.begin(), backends.end(), backend) != backends.end();
}

Result<void> Manifest::check_backend(const std::string& backend) const {
    if (!supports_backend(backend)) {
        return Err(Error(ErrorCode::NotSupported,
            "Script '" + name + "' does not support backend '" + backend + "'")
            .with_context("script", name));
    }
    return Ok();
}

bool Manifest::requires_module(const std::string& module) const {
    return std::find(required_modules.begin(), required_modules.end(), module) != required_modules.end();
}

Value Manifest::apply_defaults(const Value& config) const {
    Value result = config.is_object() ? config : Value::object();
    for (const auto& var : vars) {
        if (!result.contains(var.name) && !var.default_value.is_null()) {
            result[var.name] = var.default_value;
        }
    }
    return result;
}

Value Manifest::to_json() const {
    Value j = Value::object();
    j["name"] = name;
    j["version"] = version;
    j["author"] = author;
    j["description"] = description;
    j["autorun"] = autorun;
    j["hidden"] = hidden;
    j["enableWeb"] = enable_web;
    j["backends"] = backends;
    if (!engine.empty()) {
        j["engine"] = engine;
    }
    Value vars_json = Value::array();
    for (const auto& var : vars) {
        vars_json.push_back(var.to_json());
    }
    j["vars"] = vars_json;
    j["requiredModules"] = required_modules;
    j["voiceCommands"] = voice_commands;
    return j;
}

} // namespace relay_kernel

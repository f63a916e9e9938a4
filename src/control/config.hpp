/*
 * Copyright 2025 Conduit Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Conduit Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../pipeline/types.hpp"

namespace conduit::control {

/// Per-unit middleware configuration
struct UnitConfig {
    bool enabled = true;
    std::string category;         // basic, security, auth, logging, custom (empty = basic)
    std::optional<int> priority;  // Overrides the unit's own priority
    std::vector<std::string> dependencies;
    std::vector<std::string> conflicts;
    std::vector<std::string> paths;          // Add the unit to chains built for these paths
    std::vector<std::string> exclude_paths;  // Drop the unit for these paths
    std::vector<std::string> include_paths;  // When set, keep the unit only for these paths
    nlohmann::json settings = nlohmann::json::object();  // Free-form, owned by the unit

    /// Category as an enum (empty or unrecognized = Basic; validation rejects unrecognized)
    [[nodiscard]] pipeline::MiddlewareCategory resolved_category() const {
        return pipeline::parse_category(category).value_or(pipeline::MiddlewareCategory::Basic);
    }
};

/// Per-chain-type configuration
struct ChainConfig {
    bool enabled = true;
    std::vector<std::string> middleware;  // Allow-list (empty = every eligible unit)
    std::vector<std::string> paths;
    nlohmann::json custom = nlohmann::json::object();
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";        // debug, info, warning, error
    std::string format = "text";       // json, text
    std::string output = "console";    // "console" or a log directory ({name}.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Conduit configuration
struct Config {
    std::string version = "1.0";
    std::string environment = "production";

    // Units missing from the middleware table are enabled when true
    bool default_enabled = true;

    core::fast_map<std::string, UnitConfig> middleware;
    core::fast_map<std::string, ChainConfig> chains;  // Keyed by chain type name

    LogConfig logging;

    /// Lookup helpers (nullptr when not configured)
    [[nodiscard]] const UnitConfig* find_unit(std::string_view name) const {
        auto it = middleware.find(std::string(name));
        return it != middleware.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const ChainConfig* find_chain(pipeline::ChainType type) const {
        auto it = chains.find(std::string(pipeline::to_string(type)));
        return it != chains.end() ? &it->second : nullptr;
    }
};

// All config types use custom from_json/to_json (no macros - avoids conflicts)

inline void from_json(const nlohmann::json& j, UnitConfig& u) {
    u.enabled = j.value("enabled", true);
    u.category = j.value("category", std::string());
    if (j.contains("priority") && !j.at("priority").is_null()) {
        u.priority = j.at("priority").get<int>();
    } else {
        u.priority.reset();
    }
    u.dependencies = j.value("dependencies", std::vector<std::string>());
    u.conflicts = j.value("conflicts", std::vector<std::string>());
    u.paths = j.value("paths", std::vector<std::string>());
    u.exclude_paths = j.value("exclude_paths", std::vector<std::string>());
    u.include_paths = j.value("include_paths", std::vector<std::string>());
    u.settings = j.value("settings", nlohmann::json::object());
}

inline void to_json(nlohmann::json& j, const UnitConfig& u) {
    j = nlohmann::json{{"enabled", u.enabled},
                       {"dependencies", u.dependencies},
                       {"conflicts", u.conflicts},
                       {"paths", u.paths},
                       {"exclude_paths", u.exclude_paths},
                       {"include_paths", u.include_paths},
                       {"settings", u.settings}};
    if (!u.category.empty()) {
        j["category"] = u.category;
    }
    if (u.priority) {
        j["priority"] = *u.priority;
    }
}

inline void from_json(const nlohmann::json& j, ChainConfig& c) {
    c.enabled = j.value("enabled", true);
    c.middleware = j.value("middleware", std::vector<std::string>());
    c.paths = j.value("paths", std::vector<std::string>());
    c.custom = j.value("custom", nlohmann::json::object());
}

inline void to_json(nlohmann::json& j, const ChainConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"middleware", c.middleware},
                       {"paths", c.paths},
                       {"custom", c.custom}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("console"));
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    c.version = j.value("version", std::string("1.0"));
    c.environment = j.value("environment", std::string("production"));
    c.default_enabled = j.value("default_enabled", true);

    // Use contains() for custom struct types to avoid infinite recursion
    if (j.contains("middleware")) {
        j.at("middleware").get_to(c.middleware);
    }
    if (j.contains("chains")) {
        j.at("chains").get_to(c.chains);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    j["version"] = c.version;
    j["environment"] = c.environment;
    j["default_enabled"] = c.default_enabled;
    j["middleware"] = c.middleware;
    j["chains"] = c.chains;
    j["logging"] = c.logging;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration (schema checks plus ConfigValidator)
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);

    /// Stock unit table, chain allow-lists and path rules
    /// "development" enables every unit; any other environment only the stock set
    [[nodiscard]] static Config builtin_defaults(std::string_view environment = "production");
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Validate and publish an in-memory configuration
    [[nodiscard]] bool apply(Config config);

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

/// Read-only configuration lookups used by the registry and orchestrator
///
/// Implementations must be safe for concurrent reads.
class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    /// Whether a unit is globally enabled
    [[nodiscard]] virtual bool is_enabled(std::string_view name) const = 0;

    /// Unit configuration (defaults when the unit is not configured)
    [[nodiscard]] virtual UnitConfig unit_config(std::string_view name) const = 0;

    /// Chain configuration (defaults when the chain type is not configured)
    [[nodiscard]] virtual ChainConfig chain_config(pipeline::ChainType type) const = 0;
};

/// Provider over a fixed configuration snapshot
class StaticConfigProvider : public ConfigProvider {
public:
    explicit StaticConfigProvider(Config config)
        : config_(std::make_shared<const Config>(std::move(config))) {}

    explicit StaticConfigProvider(std::shared_ptr<const Config> config)
        : config_(std::move(config)) {}

    [[nodiscard]] bool is_enabled(std::string_view name) const override;
    [[nodiscard]] UnitConfig unit_config(std::string_view name) const override;
    [[nodiscard]] ChainConfig chain_config(pipeline::ChainType type) const override;

    [[nodiscard]] const Config& config() const noexcept { return *config_; }

private:
    std::shared_ptr<const Config> config_;
};

/// Provider reading the current ConfigManager snapshot on every lookup
/// Reloads become visible to later builds (cached chains are not invalidated).
class ManagedConfigProvider : public ConfigProvider {
public:
    explicit ManagedConfigProvider(const ConfigManager& manager) : manager_(manager) {}

    [[nodiscard]] bool is_enabled(std::string_view name) const override;
    [[nodiscard]] UnitConfig unit_config(std::string_view name) const override;
    [[nodiscard]] ChainConfig chain_config(pipeline::ChainType type) const override;

private:
    const ConfigManager& manager_;
};

}  // namespace conduit::control

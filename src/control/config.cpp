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

// Conduit Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_validator.hpp"

namespace conduit::control {

namespace {

// Stock unit table: name, category, priority
struct StockUnit {
    const char* name;
    const char* category;
    int priority;
};

constexpr StockUnit kStockUnits[] = {
    {"recovery", "basic", 10},          {"cors", "basic", 20},
    {"request-id", "basic", 30},        {"timeout", "basic", 40},
    {"security-headers", "security", 50}, {"csrf", "security", 60},
    {"rate-limit", "security", 70},     {"input-validation", "security", 80},
    {"logging", "logging", 90},         {"session", "auth", 100},
    {"authentication", "auth", 110},    {"authorization", "auth", 120},
};

// Units enabled outside development
constexpr std::string_view kProductionUnits[] = {
    "recovery", "cors",       "security-headers", "request-id",     "timeout",      "logging",
    "csrf",     "rate-limit", "session",          "authentication", "authorization",
};

bool is_production_unit(std::string_view name) {
    for (auto unit : kProductionUnits) {
        if (unit == name) {
            return true;
        }
    }
    return false;
}

nlohmann::json stock_unit_settings(std::string_view name) {
    if (name == "csrf") {
        return {{"token_header", "X-CSRF-Token"}, {"cookie_name", "csrf_token"},
                {"expire_time", 3600}};
    }
    if (name == "rate-limit") {
        return {{"requests_per_minute", 60}, {"burst_size", 10}, {"window_size", 60}};
    }
    if (name == "timeout") {
        return {{"timeout_seconds", 30}, {"grace_period", 5}};
    }
    if (name == "logging") {
        return {{"log_level", "info"},
                {"include_body", false},
                {"mask_headers", {"authorization", "cookie"}},
                {"log_requests", true},
                {"log_responses", true}};
    }
    if (name == "session") {
        return {{"session_timeout", 3600},
                {"refresh_timeout", 300},
                {"secure_cookies", true},
                {"http_only", true}};
    }
    if (name == "authentication") {
        return {{"token_expiry", 3600}, {"refresh_expiry", 86400}};
    }
    if (name == "authorization") {
        return {{"default_role", "user"}, {"admin_role", "admin"}, {"cache_ttl", 300}};
    }
    return nlohmann::json::object();
}

ChainConfig stock_chain(pipeline::ChainType type) {
    using pipeline::ChainType;

    ChainConfig chain;
    switch (type) {
        case ChainType::Default:
            chain.middleware = {"recovery", "cors", "request-id", "timeout"};
            chain.paths = {"/*"};
            chain.custom = {{"timeout", 30},
                            {"max_body_size", "10MB"},
                            {"compress", true},
                            {"cors_origins", {"*"}},
                            {"security_headers", true}};
            break;
        case ChainType::API:
            chain.middleware = {"security-headers", "session",        "csrf",
                                "rate-limit",       "authentication", "authorization"};
            chain.paths = {"/api/*"};
            chain.custom = {{"timeout", 60},
                            {"max_body_size", "50MB"},
                            {"compress", true},
                            {"cors_origins", {"https://api.example.com"}},
                            {"rate_limit", true},
                            {"authentication", true},
                            {"authorization", true},
                            {"request_logging", true},
                            {"response_logging", false}};
            break;
        case ChainType::Web:
            chain.middleware = {"session", "authentication", "authorization"};
            chain.paths = {"/dashboard/*", "/forms/*"};
            chain.custom = {{"timeout", 30},
                            {"max_body_size", "25MB"},
                            {"compress", true},
                            {"cors_origins", {"https://app.example.com"}},
                            {"session", true},
                            {"authentication", true},
                            {"authorization", true},
                            {"request_logging", true},
                            {"response_logging", false}};
            break;
        case ChainType::Auth:
            chain.middleware = {"session", "authentication"};
            chain.paths = {"/login", "/signup", "/logout"};
            chain.custom = {{"timeout", 15},
                            {"max_body_size", "5MB"},
                            {"compress", false},
                            {"cors_origins", {"https://auth.example.com"}},
                            {"session", true},
                            {"authentication", true},
                            {"csrf_protection", true},
                            {"request_logging", true},
                            {"response_logging", false}};
            break;
        case ChainType::Admin:
            chain.middleware = {"session", "authentication", "authorization"};
            chain.paths = {"/admin/*"};
            chain.custom = {{"timeout", 60},
                            {"max_body_size", "100MB"},
                            {"compress", true},
                            {"cors_origins", {"https://admin.example.com"}},
                            {"session", true},
                            {"authentication", true},
                            {"authorization", true},
                            {"rate_limit", true},
                            {"request_logging", true},
                            {"response_logging", true},
                            {"audit_logging", true}};
            break;
        case ChainType::Public:
            chain.middleware = {"recovery", "cors"};
            chain.paths = {"/public/*"};
            chain.custom = {{"timeout", 10},
                            {"max_body_size", "1MB"},
                            {"compress", true},
                            {"cors_origins", {"*"}},
                            {"session", false},
                            {"authentication", false},
                            {"authorization", false},
                            {"request_logging", false},
                            {"response_logging", false}};
            break;
        case ChainType::Static:
            chain.middleware = {"recovery"};
            chain.paths = {"/static/*", "/assets/*"};
            chain.custom = {{"timeout", 5},
                            {"max_body_size", "100MB"},
                            {"compress", true},
                            {"cors_origins", {"*"}},
                            {"session", false},
                            {"authentication", false},
                            {"authorization", false},
                            {"request_logging", false},
                            {"response_logging", false},
                            {"cache_headers", true},
                            {"cache_duration", 86400}};
            break;
    }
    return chain;
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Parse error - log detailed error message
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    // Validate configuration
    auto validation = validate(config);

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    if (config.environment.empty()) {
        result.add_error("environment cannot be empty");
    }

    for (const auto& [name, unit] : config.middleware) {
        if (!unit.category.empty() && !pipeline::parse_category(unit.category)) {
            result.add_error(fmt::format(
                "Middleware '{}': unknown category '{}' (expected basic, security, auth, "
                "logging or custom)",
                name, unit.category));
        }
    }

    // Validate logging
    const auto& log = config.logging;
    if (log.level != "debug" && log.level != "info" && log.level != "warning" &&
        log.level != "warn" && log.level != "error") {
        result.add_error(fmt::format("Unknown logging level '{}'", log.level));
    }
    if (log.format != "text" && log.format != "json") {
        result.add_error(fmt::format("Unknown logging format '{}'", log.format));
    }
    if (log.output.empty()) {
        result.add_error("logging output cannot be empty");
    }
    if (log.output != "console" && log.rotation.max_size_mb == 0) {
        result.add_error("logging rotation max_size_mb must be > 0");
    }

    // Reference checks, name security, typo suggestions
    ValidationResult references = ConfigValidator::validate(config);
    for (auto& error : references.errors) {
        result.add_error(std::move(error));
    }
    for (auto& warning : references.warnings) {
        result.add_warning(std::move(warning));
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

Config ConfigLoader::builtin_defaults(std::string_view environment) {
    Config config;
    config.environment = std::string(environment);

    const bool development = environment == "development";
    config.default_enabled = development;

    for (const auto& stock : kStockUnits) {
        UnitConfig unit;
        unit.enabled = development || is_production_unit(stock.name);
        unit.category = stock.category;
        unit.priority = stock.priority;
        unit.settings = stock_unit_settings(stock.name);
        config.middleware.emplace(stock.name, std::move(unit));
    }

    auto& authorization = config.middleware["authorization"];
    authorization.dependencies = {"authentication"};

    auto& csrf = config.middleware["csrf"];
    csrf.dependencies = {"session"};
    csrf.conflicts = {"no-csrf"};
    csrf.paths = {"/api/*", "/forms/*"};
    csrf.exclude_paths = {"/api/public/*", "/static/*"};

    auto& rate_limit = config.middleware["rate-limit"];
    rate_limit.paths = {"/api/*"};
    rate_limit.exclude_paths = {"/health", "/metrics"};

    for (auto type : pipeline::all_chain_types()) {
        config.chains.emplace(std::string(pipeline::to_string(type)), stock_chain(type));
    }

    return config;
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    return apply(std::move(*maybe_config));
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        return false;
    }

    return apply(std::move(*maybe_config));
}

bool ConfigManager::apply(Config config) {
    // Validate configuration
    last_validation_ = ConfigLoader::validate(config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU pattern: Create new shared_ptr and atomically swap
    // Old config remains valid until all readers release their references
    auto new_config = std::make_shared<const Config>(std::move(config));
    std::atomic_store(&current_config_, new_config);

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    // Atomic load - safe for concurrent readers
    return std::atomic_load(&current_config_);
}

// Provider implementations

namespace {

bool lookup_enabled(const Config* config, std::string_view name) {
    if (!config) {
        return true;
    }
    const UnitConfig* unit = config->find_unit(name);
    return unit ? unit->enabled : config->default_enabled;
}

UnitConfig lookup_unit(const Config* config, std::string_view name) {
    if (config) {
        if (const UnitConfig* unit = config->find_unit(name)) {
            return *unit;
        }
    }
    UnitConfig unit;
    unit.enabled = config ? config->default_enabled : true;
    return unit;
}

ChainConfig lookup_chain(const Config* config, pipeline::ChainType type) {
    if (config) {
        if (const ChainConfig* chain = config->find_chain(type)) {
            return *chain;
        }
    }
    return ChainConfig{};
}

}  // namespace

bool StaticConfigProvider::is_enabled(std::string_view name) const {
    return lookup_enabled(config_.get(), name);
}

UnitConfig StaticConfigProvider::unit_config(std::string_view name) const {
    return lookup_unit(config_.get(), name);
}

ChainConfig StaticConfigProvider::chain_config(pipeline::ChainType type) const {
    return lookup_chain(config_.get(), type);
}

bool ManagedConfigProvider::is_enabled(std::string_view name) const {
    auto config = manager_.get();
    return lookup_enabled(config.get(), name);
}

UnitConfig ManagedConfigProvider::unit_config(std::string_view name) const {
    auto config = manager_.get();
    return lookup_unit(config.get(), name);
}

ChainConfig ManagedConfigProvider::chain_config(pipeline::ChainType type) const {
    auto config = manager_.get();
    return lookup_chain(config.get(), type);
}

}  // namespace conduit::control

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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "../core/string_utils.hpp"

namespace conduit::control {

namespace {

// Append ". Did you mean: x" when a suggestion exists
std::string with_suggestion(std::string message, const std::string& suggestion) {
    if (!suggestion.empty()) {
        message += ". Did you mean: ";
        message += suggestion;
    }
    return message;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;

    validate_unit_names(config, result);
    validate_relations(config, result);
    validate_chains(config, result);

    return result;
}

std::string ConfigValidator::check_name(std::string_view name) {
    // Length check (prevent DoS via long names)
    if (name.empty()) {
        return "Middleware name cannot be empty";
    }
    if (name.length() > MAX_MIDDLEWARE_NAME_LENGTH) {
        return fmt::format("Middleware name too long ({} > {} chars)", name.length(),
                           MAX_MIDDLEWARE_NAME_LENGTH);
    }

    // Character whitelist: [a-zA-Z0-9_-] only
    for (size_t i = 0; i < name.length(); ++i) {
        char c = name[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            if (c == '\0') {
                return "Null byte detected";
            }
            if (c == '\r' || c == '\n') {
                return "Line breaks not allowed";
            }
            return fmt::format(
                "Invalid character '{}' at position {} (only alphanumeric, underscore, and "
                "hyphen allowed)",
                c, i);
        }
    }

    return "";
}

void ConfigValidator::validate_unit_names(const Config& config, ValidationResult& result) {
    for (const auto& [name, _] : config.middleware) {
        std::string error = check_name(name);
        if (!error.empty()) {
            result.add_error(fmt::format("Invalid middleware name '{}': {}", name, error));
        }
    }

    if (config.middleware.size() > MAX_REGISTERED_MIDDLEWARE) {
        result.add_error(fmt::format("Too many configured middleware ({} > {})",
                                     config.middleware.size(), MAX_REGISTERED_MIDDLEWARE));
    }
}

void ConfigValidator::validate_relations(const Config& config, ValidationResult& result) {
    std::vector<std::string> available = get_all_unit_names(config);

    for (const auto& [name, unit] : config.middleware) {
        for (const auto& dependency : unit.dependencies) {
            if (dependency == name) {
                result.add_error(fmt::format("Middleware '{}' depends on itself", name));
                continue;
            }
            if (contains(unit.conflicts, dependency)) {
                result.add_error(fmt::format(
                    "Middleware '{}' both depends on and conflicts with '{}'", name, dependency));
                continue;
            }
            if (!config.middleware.contains(dependency)) {
                result.add_warning(with_suggestion(
                    fmt::format("Middleware '{}': dependency '{}' is not configured", name,
                                dependency),
                    suggest_similar(available, dependency)));
            }
        }

        for (const auto& conflict : unit.conflicts) {
            if (conflict == name) {
                result.add_error(fmt::format("Middleware '{}' conflicts with itself", name));
                continue;
            }
            if (!config.middleware.contains(conflict)) {
                result.add_warning(with_suggestion(
                    fmt::format("Middleware '{}': conflict '{}' is not configured", name,
                                conflict),
                    suggest_similar(available, conflict)));
            }
        }
    }
}

void ConfigValidator::validate_chains(const Config& config, ValidationResult& result) {
    std::vector<std::string> chain_names;
    for (auto type : pipeline::all_chain_types()) {
        chain_names.emplace_back(pipeline::to_string(type));
    }

    std::vector<std::string> available = get_all_unit_names(config);

    for (const auto& [chain_name, chain] : config.chains) {
        if (!pipeline::parse_chain_type(chain_name)) {
            result.add_error(with_suggestion(fmt::format("Unknown chain type '{}'", chain_name),
                                             suggest_similar(chain_names, chain_name)));
            continue;
        }

        for (const auto& unit_name : chain.middleware) {
            std::string error = check_name(unit_name);
            if (!error.empty()) {
                result.add_error(fmt::format("Chain '{}': invalid middleware name '{}': {}",
                                             chain_name, unit_name, error));
                continue;
            }
            if (!config.middleware.contains(unit_name)) {
                result.add_warning(with_suggestion(
                    fmt::format("Chain '{}': middleware '{}' is not configured", chain_name,
                                unit_name),
                    suggest_similar(available, unit_name)));
            }
        }
    }
}

std::vector<std::string> ConfigValidator::get_all_unit_names(const Config& config) {
    std::vector<std::string> names;
    names.reserve(config.middleware.size());
    for (const auto& [name, _] : config.middleware) {
        names.push_back(name);
    }
    // Deterministic suggestion order
    std::sort(names.begin(), names.end());
    return names;
}

std::string ConfigValidator::suggest_similar(const std::vector<std::string>& available,
                                             const std::string& typo) {
    // Limit typo length to prevent DoS via fuzzy matching
    if (typo.length() > MAX_MIDDLEWARE_NAME_LENGTH) {
        return "";
    }

    std::vector<std::string> similar =
        core::find_similar_strings(typo, available, MAX_LEVENSHTEIN_DISTANCE);

    // Limit number of suggestions (prevent output bloat)
    if (similar.size() > MAX_FUZZY_MATCH_CANDIDATES) {
        similar.resize(MAX_FUZZY_MATCH_CANDIDATES);
    }

    return core::join(similar, ", ");
}

}  // namespace conduit::control

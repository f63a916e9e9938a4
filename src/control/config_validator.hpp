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

// Configuration Validator - Name Security & Reference Validation

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace conduit::control {

// Validation limits
inline constexpr size_t MAX_MIDDLEWARE_NAME_LENGTH = 128;
inline constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 2;
inline constexpr size_t MAX_FUZZY_MATCH_CANDIDATES = 3;
inline constexpr size_t MAX_REGISTERED_MIDDLEWARE = 1000;

/// Relationship and typo checks over the middleware and chain tables
class ConfigValidator {
public:
    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Empty when valid, otherwise the reason the name is rejected
    [[nodiscard]] static std::string check_name(std::string_view name);

private:
    /// Unit names: character set, length, count
    static void validate_unit_names(const Config& config, ValidationResult& result);

    /// Dependencies and conflicts (self references, contradictions, typos)
    static void validate_relations(const Config& config, ValidationResult& result);

    /// Chain table keys and allow-list references
    static void validate_chains(const Config& config, ValidationResult& result);

    /// Get all configured unit names
    [[nodiscard]] static std::vector<std::string> get_all_unit_names(const Config& config);

    /// Suggest similar unit names for typos (empty if none)
    [[nodiscard]] static std::string suggest_similar(const std::vector<std::string>& available,
                                                     const std::string& typo);
};

}  // namespace conduit::control

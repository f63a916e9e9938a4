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

// Conduit Pipeline Types - Header
// Chain types, middleware categories and the fixed tables between them

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::pipeline {

/// Priority used when neither configuration nor the unit supplies one
inline constexpr int kDefaultPriority = 50;

/// Request traffic class; selects which categories of units are eligible
enum class ChainType : uint8_t {
    Default,
    API,
    Web,
    Auth,
    Admin,
    Public,
    Static
};

/// Coarse classification of a unit's purpose
enum class MiddlewareCategory : uint8_t {
    Basic,
    Security,
    Auth,
    Logging,
    Custom
};

/// Every chain type, in declaration order
[[nodiscard]] const std::array<ChainType, 7>& all_chain_types() noexcept;

/// Chain type name: "default", "api", "web", "auth", "admin", "public", "static"
[[nodiscard]] std::string_view to_string(ChainType type) noexcept;

/// Category name: "basic", "security", "auth", "logging", "custom"
[[nodiscard]] std::string_view to_string(MiddlewareCategory category) noexcept;

/// Parse a chain type name (case-sensitive); nullopt when unknown
[[nodiscard]] std::optional<ChainType> parse_chain_type(std::string_view name) noexcept;

/// Parse a category name (case-sensitive); nullopt when unknown
[[nodiscard]] std::optional<MiddlewareCategory> parse_category(std::string_view name) noexcept;

/// Categories whose units are eligible for a chain type
[[nodiscard]] const std::vector<MiddlewareCategory>& categories_for(ChainType type);

/// Human readable description of a chain type
[[nodiscard]] std::string_view description_for(ChainType type) noexcept;

/// Read-only descriptor of a chain type (introspection only)
struct ChainInfo {
    ChainType type = ChainType::Default;
    std::string name;
    std::string description;
    std::vector<MiddlewareCategory> categories;
    std::vector<std::string> units;  // Resolved unit names, execution order
    bool enabled = true;
    std::vector<std::string> path_patterns;
    nlohmann::json custom_config = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const ChainInfo& info);

}  // namespace conduit::pipeline

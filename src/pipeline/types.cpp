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

// Conduit Pipeline Types - Implementation

#include "types.hpp"

#include <utility>

namespace conduit::pipeline {

namespace {

constexpr std::pair<std::string_view, ChainType> kChainTypeNames[] = {
    {"default", ChainType::Default}, {"api", ChainType::API},       {"web", ChainType::Web},
    {"auth", ChainType::Auth},       {"admin", ChainType::Admin},   {"public", ChainType::Public},
    {"static", ChainType::Static},
};

constexpr std::pair<std::string_view, MiddlewareCategory> kCategoryNames[] = {
    {"basic", MiddlewareCategory::Basic},     {"security", MiddlewareCategory::Security},
    {"auth", MiddlewareCategory::Auth},       {"logging", MiddlewareCategory::Logging},
    {"custom", MiddlewareCategory::Custom},
};

}  // namespace

const std::array<ChainType, 7>& all_chain_types() noexcept {
    static constexpr std::array<ChainType, 7> kAll = {
        ChainType::Default, ChainType::API,    ChainType::Web,    ChainType::Auth,
        ChainType::Admin,   ChainType::Public, ChainType::Static,
    };
    return kAll;
}

std::string_view to_string(ChainType type) noexcept {
    for (const auto& [name, value] : kChainTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "default";
}

std::string_view to_string(MiddlewareCategory category) noexcept {
    for (const auto& [name, value] : kCategoryNames) {
        if (value == category) {
            return name;
        }
    }
    return "basic";
}

std::optional<ChainType> parse_chain_type(std::string_view name) noexcept {
    for (const auto& [candidate, value] : kChainTypeNames) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<MiddlewareCategory> parse_category(std::string_view name) noexcept {
    for (const auto& [candidate, value] : kCategoryNames) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

const std::vector<MiddlewareCategory>& categories_for(ChainType type) {
    using C = MiddlewareCategory;

    static const std::vector<C> kDefault = {C::Basic, C::Security, C::Logging};
    static const std::vector<C> kFull = {C::Basic, C::Security, C::Auth, C::Logging};
    static const std::vector<C> kAuth = {C::Basic, C::Security, C::Auth};
    static const std::vector<C> kPublic = {C::Basic, C::Security};
    static const std::vector<C> kStatic = {C::Basic};

    switch (type) {
        case ChainType::Default:
            return kDefault;
        case ChainType::API:
        case ChainType::Web:
        case ChainType::Admin:
            return kFull;
        case ChainType::Auth:
            return kAuth;
        case ChainType::Public:
            return kPublic;
        case ChainType::Static:
            return kStatic;
    }
    return kDefault;
}

std::string_view description_for(ChainType type) noexcept {
    switch (type) {
        case ChainType::Default:
            return "Default middleware chain for most requests";
        case ChainType::API:
            return "Middleware chain for API requests with authentication and logging";
        case ChainType::Web:
            return "Middleware chain for web page requests with session management";
        case ChainType::Auth:
            return "Middleware chain for authentication endpoints";
        case ChainType::Admin:
            return "Middleware chain for admin-only endpoints with enhanced security";
        case ChainType::Public:
            return "Middleware chain for public endpoints with basic security";
        case ChainType::Static:
            return "Middleware chain for static asset requests with caching";
    }
    return "Unknown middleware chain type";
}

void to_json(nlohmann::json& j, const ChainInfo& info) {
    std::vector<std::string> categories;
    categories.reserve(info.categories.size());
    for (auto category : info.categories) {
        categories.emplace_back(to_string(category));
    }

    j = nlohmann::json{{"type", std::string(to_string(info.type))},
                       {"name", info.name},
                       {"description", info.description},
                       {"categories", categories},
                       {"units", info.units},
                       {"enabled", info.enabled},
                       {"path_patterns", info.path_patterns},
                       {"custom_config", info.custom_config}};
}

}  // namespace conduit::pipeline

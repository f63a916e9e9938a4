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

// Conduit Registry - Header
// Catalog of registered middleware units and their derived metadata

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "errors.hpp"
#include "middleware.hpp"
#include "types.hpp"

namespace conduit::pipeline {

/// Metadata derived from configuration at registration
struct UnitMetadata {
    MiddlewareCategory category = MiddlewareCategory::Basic;
    int priority = kDefaultPriority;
    std::vector<std::string> dependencies;
    std::vector<std::string> conflicts;
    uint64_t sequence = 0;  // Registration order (tie-break for equal priorities)
};

/// Registered unit with its catalog name and metadata
struct RegisteredUnit {
    std::string name;
    MiddlewarePtr unit;
    UnitMetadata metadata;
};

/// Order by (priority, registration sequence)
[[nodiscard]] inline bool priority_less(const RegisteredUnit& a, const RegisteredUnit& b) noexcept {
    if (a.metadata.priority != b.metadata.priority) {
        return a.metadata.priority < b.metadata.priority;
    }
    return a.metadata.sequence < b.metadata.sequence;
}

/// Middleware registry
///
/// Thread-safe: one shared_mutex guards the catalog, category index and
/// metadata. The configuration provider is never called with the lock held.
class Registry {
public:
    explicit Registry(const control::ConfigProvider& config, quill::Logger* logger = nullptr)
        : config_(config), logger_(logger) {}

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Register a unit under name
    /// AlreadyRegistered on duplicates; a globally disabled unit is skipped
    /// without error and is not catalogued.
    [[nodiscard]] Error register_unit(std::string name, MiddlewarePtr unit);

    /// Register a unit under its own name()
    [[nodiscard]] Error register_unit(MiddlewarePtr unit);

    [[nodiscard]] MiddlewarePtr get(std::string_view name) const;

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> list() const;

    /// Remove a unit and everything derived from it
    bool remove(std::string_view name);

    void clear();

    [[nodiscard]] size_t count() const;

    [[nodiscard]] std::optional<UnitMetadata> metadata(std::string_view name) const;

    /// Enabled units of a category, ascending priority (ties in registration order)
    [[nodiscard]] std::vector<MiddlewarePtr> get_ordered(MiddlewareCategory category) const;

    /// Same as get_ordered, with names and metadata
    [[nodiscard]] std::vector<RegisteredUnit> get_ordered_entries(
        MiddlewareCategory category) const;

    /// Every registered unit in registration order
    [[nodiscard]] std::vector<RegisteredUnit> snapshot() const;

    /// Registry-wide check: declared dependencies registered, declared conflicts absent
    /// Units are checked in registration order; the first violation is returned.
    [[nodiscard]] Error validate_dependencies() const;

    [[nodiscard]] const control::ConfigProvider& config() const noexcept { return config_; }

private:
    struct Entry {
        MiddlewarePtr unit;
        UnitMetadata metadata;
    };

    static constexpr size_t kCategoryCount = 5;

    const control::ConfigProvider& config_;
    quill::Logger* logger_;

    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, Entry> entries_;
    std::array<std::vector<std::string>, kCategoryCount> category_index_;
    uint64_t next_sequence_ = 0;
};

}  // namespace conduit::pipeline

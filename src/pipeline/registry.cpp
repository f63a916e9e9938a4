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

// Conduit Registry - Implementation

#include "registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <mutex>

namespace conduit::pipeline {

namespace {

size_t category_slot(MiddlewareCategory category) {
    return static_cast<size_t>(category);
}

}  // namespace

Error Registry::register_unit(std::string name, MiddlewarePtr unit) {
    // Configuration is read before taking the lock
    const bool enabled = config_.is_enabled(name);
    control::UnitConfig unit_config = config_.unit_config(name);

    {
        std::shared_lock lock(mutex_);
        if (entries_.contains(name)) {
            CONDUIT_LOG_WARNING(logger_, "Middleware already registered: name={}", name);
            return make_error(Errc::AlreadyRegistered,
                              fmt::format("middleware '{}' is already registered", name));
        }
    }

    if (!enabled) {
        CONDUIT_LOG_INFO(logger_, "Middleware disabled by configuration, skipping: name={}", name);
        return {};
    }

    UnitMetadata metadata;
    metadata.category = unit_config.resolved_category();
    metadata.priority = unit_config.priority.value_or(unit->priority());
    metadata.dependencies = std::move(unit_config.dependencies);
    metadata.conflicts = std::move(unit_config.conflicts);

    std::unique_lock lock(mutex_);

    // Re-check under the write lock (another thread may have won)
    if (entries_.contains(name)) {
        return make_error(Errc::AlreadyRegistered,
                          fmt::format("middleware '{}' is already registered", name));
    }

    metadata.sequence = next_sequence_++;
    category_index_[category_slot(metadata.category)].push_back(name);

    CONDUIT_LOG_INFO(logger_, "Middleware registered: name={}, category={}, priority={}", name,
                     std::string(to_string(metadata.category)), metadata.priority);

    entries_.emplace(std::move(name), Entry{std::move(unit), std::move(metadata)});
    return {};
}

Error Registry::register_unit(MiddlewarePtr unit) {
    std::string name(unit->name());
    return register_unit(std::move(name), std::move(unit));
}

MiddlewarePtr Registry::get(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(name));
    return it != entries_.end() ? it->second.unit : nullptr;
}

std::vector<std::string> Registry::list() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        names.reserve(entries_.size());
        for (const auto& [name, _] : entries_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool Registry::remove(std::string_view name) {
    std::unique_lock lock(mutex_);

    auto it = entries_.find(std::string(name));
    if (it == entries_.end()) {
        return false;
    }

    auto& index = category_index_[category_slot(it->second.metadata.category)];
    index.erase(std::remove(index.begin(), index.end(), name), index.end());
    entries_.erase(it);

    CONDUIT_LOG_INFO(logger_, "Middleware removed: name={}", std::string(name));
    return true;
}

void Registry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    for (auto& index : category_index_) {
        index.clear();
    }
}

size_t Registry::count() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::optional<UnitMetadata> Registry::metadata(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(name));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.metadata;
}

std::vector<MiddlewarePtr> Registry::get_ordered(MiddlewareCategory category) const {
    std::vector<MiddlewarePtr> units;
    for (auto& entry : get_ordered_entries(category)) {
        units.push_back(std::move(entry.unit));
    }
    return units;
}

std::vector<RegisteredUnit> Registry::get_ordered_entries(MiddlewareCategory category) const {
    std::vector<RegisteredUnit> candidates;
    {
        std::shared_lock lock(mutex_);
        const auto& index = category_index_[category_slot(category)];
        candidates.reserve(index.size());
        for (const auto& name : index) {
            auto it = entries_.find(name);
            if (it != entries_.end()) {
                candidates.push_back(RegisteredUnit{name, it->second.unit, it->second.metadata});
            }
        }
    }

    // Enablement may have changed since registration (hot reload)
    std::erase_if(candidates,
                  [this](const RegisteredUnit& entry) { return !config_.is_enabled(entry.name); });

    std::stable_sort(candidates.begin(), candidates.end(), priority_less);
    return candidates;
}

std::vector<RegisteredUnit> Registry::snapshot() const {
    std::vector<RegisteredUnit> units;
    {
        std::shared_lock lock(mutex_);
        units.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            units.push_back(RegisteredUnit{name, entry.unit, entry.metadata});
        }
    }

    std::sort(units.begin(), units.end(), [](const RegisteredUnit& a, const RegisteredUnit& b) {
        return a.metadata.sequence < b.metadata.sequence;
    });
    return units;
}

Error Registry::validate_dependencies() const {
    std::vector<RegisteredUnit> units = snapshot();

    core::fast_set<std::string> present;
    for (const auto& entry : units) {
        present.insert(entry.name);
    }

    for (const auto& entry : units) {
        for (const auto& dependency : entry.metadata.dependencies) {
            if (!present.contains(dependency)) {
                return make_error(Errc::MissingDependency,
                                  fmt::format("middleware '{}' depends on '{}', which is not "
                                              "registered",
                                              entry.name, dependency));
            }
        }
        for (const auto& conflict : entry.metadata.conflicts) {
            if (present.contains(conflict)) {
                return make_error(Errc::ConflictingUnit,
                                  fmt::format("middleware '{}' conflicts with registered "
                                              "middleware '{}'",
                                              entry.name, conflict));
            }
        }
    }

    return {};
}

}  // namespace conduit::pipeline

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

// Conduit Orchestrator - Implementation

#include "orchestrator.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "../core/string_utils.hpp"

namespace conduit::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

std::vector<std::string> names_of(const std::vector<RegisteredUnit>& units) {
    std::vector<std::string> names;
    names.reserve(units.size());
    for (const auto& entry : units) {
        names.push_back(entry.name);
    }
    return names;
}

bool contains_name(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Dependencies must be inside the set, conflicts outside it
Error validate_unit_set(const std::vector<RegisteredUnit>& units) {
    core::fast_set<std::string> present;
    for (const auto& entry : units) {
        present.insert(entry.name);
    }

    for (const auto& entry : units) {
        for (const auto& dependency : entry.metadata.dependencies) {
            if (!present.contains(dependency)) {
                return make_error(Errc::MissingDependency,
                                  fmt::format("middleware '{}' requires '{}', which is not in "
                                              "the chain",
                                              entry.name, dependency));
            }
        }
        for (const auto& conflict : entry.metadata.conflicts) {
            if (present.contains(conflict)) {
                return make_error(Errc::ConflictingUnit,
                                  fmt::format("middleware '{}' conflicts with '{}' in the chain",
                                              entry.name, conflict));
            }
        }
    }

    return {};
}

}  // namespace

void to_json(nlohmann::json& j, const CacheStats& stats) {
    nlohmann::json build_times = nlohmann::json::object();
    for (const auto& [chain_type, duration] : stats.build_times) {
        build_times[chain_type] =
            std::chrono::duration_cast<std::chrono::microseconds>(duration).count();
    }

    j = nlohmann::json{{"cache_size", stats.cache_size},
                       {"build_times_us", build_times},
                       {"registered_chains", stats.registered_chains},
                       {"max_cache_size", stats.max_cache_size},
                       {"uncached_builds", stats.uncached_builds}};
}

std::string Orchestrator::cache_key(ChainType type, std::string_view path) {
    return fmt::format("path:{}:{}", to_string(type), path);
}

bool Orchestrator::assemble(ChainType type, std::vector<RegisteredUnit>& units,
                            Error& error_out) const {
    units.clear();

    // Per-category units (already enabled-filtered and priority ordered)
    for (auto category : categories_for(type)) {
        auto ordered = registry_.get_ordered_entries(category);
        units.insert(units.end(), std::make_move_iterator(ordered.begin()),
                     std::make_move_iterator(ordered.end()));
    }

    // One global order across categories
    std::stable_sort(units.begin(), units.end(), priority_less);

    const control::ChainConfig chain_config = config_.chain_config(type);
    if (!chain_config.enabled) {
        units.clear();
        return true;
    }

    if (!chain_config.middleware.empty()) {
        std::erase_if(units, [&chain_config](const RegisteredUnit& entry) {
            return !contains_name(chain_config.middleware, entry.name);
        });
    }

    Error validation = validate_unit_set(units);
    if (validation) {
        error_out = wrap_error(Errc::ChainValidationFailed, validation,
                               fmt::format("chain '{}'", to_string(type)));
        LOG_VALIDATION_FAILED(logger_, std::string(to_string(type)), validation.code.value(),
                              validation.message);
        units.clear();
        return false;
    }

    return true;
}

void Orchestrator::specialize_for_path(std::vector<RegisteredUnit>& units,
                                       std::string_view path) const {
    // Additive: registered, enabled units declaring a matching path
    bool added = false;
    for (auto& entry : registry_.snapshot()) {
        bool present = std::any_of(units.begin(), units.end(), [&entry](const RegisteredUnit& u) {
            return u.name == entry.name;
        });
        if (present || !config_.is_enabled(entry.name)) {
            continue;
        }

        control::UnitConfig unit_config = config_.unit_config(entry.name);
        if (matcher_.matches_any(unit_config.paths, path)) {
            units.push_back(std::move(entry));
            added = true;
        }
    }

    if (added) {
        std::stable_sort(units.begin(), units.end(), priority_less);
    }

    // Subtractive: exclusions first, then include_paths requirements
    std::erase_if(units, [this, path](const RegisteredUnit& entry) {
        control::UnitConfig unit_config = config_.unit_config(entry.name);
        if (matcher_.matches_any(unit_config.exclude_paths, path)) {
            return true;
        }
        return !unit_config.include_paths.empty() &&
               !matcher_.matches_any(unit_config.include_paths, path);
    });
}

std::shared_ptr<Chain> Orchestrator::make_chain(ChainType type,
                                                const std::vector<RegisteredUnit>& units,
                                                BuildDuration elapsed) const {
    std::vector<MiddlewarePtr> ordered;
    ordered.reserve(units.size());
    for (const auto& entry : units) {
        ordered.push_back(entry.unit);
    }

    LOG_CHAIN_BUILT(logger_, std::string(to_string(type)), units.size(),
                    core::join(names_of(units), ", "),
                    std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());

    return std::make_shared<Chain>(std::move(ordered), logger_);
}

std::shared_ptr<Chain> Orchestrator::create_chain(ChainType type, Error& error_out) {
    auto start = Clock::now();

    std::vector<RegisteredUnit> units;
    bool ok = assemble(type, units, error_out);

    // Recorded for failed builds too
    auto elapsed = std::chrono::duration_cast<BuildDuration>(Clock::now() - start);
    record_build_time(type, elapsed);

    if (!ok) {
        return nullptr;
    }
    return make_chain(type, units, elapsed);
}

std::shared_ptr<Chain> Orchestrator::build_chain_for_path(ChainType type, std::string_view path,
                                                          Error& error_out) {
    auto start = Clock::now();

    std::vector<RegisteredUnit> units;
    bool ok = assemble(type, units, error_out);

    // A disabled chain type stays empty for every path
    if (ok && config_.chain_config(type).enabled) {
        specialize_for_path(units, path);
    }

    auto elapsed = std::chrono::duration_cast<BuildDuration>(Clock::now() - start);
    record_build_time(type, elapsed);

    if (!ok) {
        return nullptr;
    }
    return make_chain(type, units, elapsed);
}

std::shared_ptr<const Chain> Orchestrator::get_chain_for_path(ChainType type,
                                                              std::string_view path,
                                                              Error& error_out) {
    std::string key = cache_key(type, path);

    {
        std::shared_lock lock(cache_mutex_);
        auto it = path_cache_.find(key);
        if (it != path_cache_.end()) {
            return it->second;
        }
    }

    std::shared_ptr<const Chain> chain = build_chain_for_path(type, path, error_out);
    if (!chain) {
        return nullptr;
    }

    std::unique_lock lock(cache_mutex_);
    auto it = path_cache_.find(key);
    if (it != path_cache_.end()) {
        // Another thread inserted first
        return it->second;
    }

    if (path_cache_.size() >= max_cached_paths_) {
        lock.unlock();
        if (uncached_builds_.fetch_add(1, std::memory_order_relaxed) == 0) {
            CONDUIT_LOG_WARNING(logger_,
                                "Path cache full, serving uncached chains: max_cached_paths={}",
                                max_cached_paths_);
        }
        return chain;
    }

    it = path_cache_.emplace(std::move(key), std::move(chain)).first;
    CONDUIT_LOG_DEBUG(logger_, "Chain cached: key={}, unit_count={}", it->first,
                      it->second->length());
    return it->second;
}

std::shared_ptr<Chain> Orchestrator::get_chain(std::string_view name) const {
    std::shared_lock lock(named_mutex_);
    auto it = named_chains_.find(std::string(name));
    return it != named_chains_.end() ? it->second : nullptr;
}

Error Orchestrator::register_chain(std::string name, std::shared_ptr<Chain> chain) {
    std::unique_lock lock(named_mutex_);
    if (named_chains_.contains(name)) {
        return make_error(Errc::AlreadyExists, fmt::format("chain '{}' already exists", name));
    }
    named_chains_.emplace(std::move(name), std::move(chain));
    return {};
}

std::vector<std::string> Orchestrator::list_chains() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(named_mutex_);
        names.reserve(named_chains_.size());
        for (const auto& [name, _] : named_chains_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool Orchestrator::remove_chain(std::string_view name) {
    std::unique_lock lock(named_mutex_);
    return named_chains_.erase(std::string(name)) > 0;
}

void Orchestrator::clear_cache() {
    std::unique_lock lock(cache_mutex_);
    path_cache_.clear();
}

Error Orchestrator::validate_configuration() {
    Error error = registry_.validate_dependencies();
    if (error) {
        LOG_VALIDATION_FAILED(logger_, std::string("registry"), error.code.value(),
                              error.message);
        return error;
    }

    for (auto type : all_chain_types()) {
        auto chain = create_chain(type, error);
        if (!chain) {
            return error;
        }
    }

    CONDUIT_LOG_INFO(logger_, "Middleware configuration valid: units={}, chain_types={}",
                     registry_.count(), all_chain_types().size());
    return {};
}

ChainInfo Orchestrator::get_chain_info(ChainType type) {
    const control::ChainConfig chain_config = config_.chain_config(type);

    ChainInfo info;
    info.type = type;
    info.name = std::string(to_string(type));
    info.description = std::string(description_for(type));
    info.categories = categories_for(type);
    info.enabled = chain_config.enabled;
    info.path_patterns = chain_config.paths;
    info.custom_config = chain_config.custom;

    // Introspection only: no build time sample, no build log
    std::vector<RegisteredUnit> units;
    Error error;
    if (assemble(type, units, error)) {
        info.units = names_of(units);
    }

    return info;
}

std::map<std::string, BuildDuration> Orchestrator::get_chain_performance() const {
    std::lock_guard lock(build_mutex_);
    return {build_times_.begin(), build_times_.end()};
}

CacheStats Orchestrator::get_cache_stats() const {
    CacheStats stats;
    {
        std::shared_lock lock(cache_mutex_);
        stats.cache_size = path_cache_.size();
    }
    {
        std::shared_lock lock(named_mutex_);
        stats.registered_chains = named_chains_.size();
    }
    stats.build_times = get_chain_performance();
    stats.max_cache_size = max_cached_paths_;
    stats.uncached_builds = uncached_builds_.load(std::memory_order_relaxed);
    return stats;
}

void Orchestrator::record_build_time(ChainType type, BuildDuration elapsed) {
    std::lock_guard lock(build_mutex_);
    build_times_[std::string(to_string(type))] = elapsed;
}

}  // namespace conduit::pipeline

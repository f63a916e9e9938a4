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

// Conduit Orchestrator - Header
// Builds, validates, specializes and caches chains per chain type and path

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "chain.hpp"
#include "errors.hpp"
#include "path_matcher.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace conduit::pipeline {

using BuildDuration = std::chrono::nanoseconds;

/// Default bound on path cache entries
inline constexpr size_t kDefaultMaxCachedPaths = 4096;

/// Cache diagnostics
struct CacheStats {
    size_t cache_size = 0;                           // Path cache entries
    std::map<std::string, BuildDuration> build_times;  // Last build per chain type
    size_t registered_chains = 0;                    // Named chains
    size_t max_cache_size = 0;                       // Path cache bound
    uint64_t uncached_builds = 0;                    // Builds returned without caching (cache full)
};

void to_json(nlohmann::json& j, const CacheStats& stats);

/// Chain orchestrator
///
/// Build request: categories -> per-category units -> global priority sort
/// -> chain config filter -> dependency/conflict validation -> Chain.
/// Failures return nullptr with error_out filled; nothing partial escapes and
/// failed builds are never cached.
///
/// Locking: path cache, named chains and build times each have their own
/// lock, and no operation holds two of them (or the registry's) at once.
class Orchestrator {
public:
    Orchestrator(Registry& registry, const control::ConfigProvider& config,
                 quill::Logger* logger = nullptr, size_t max_cached_paths = kDefaultMaxCachedPaths)
        : registry_(registry),
          config_(config),
          logger_(logger),
          max_cached_paths_(max_cached_paths) {}

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Build the chain for a chain type
    [[nodiscard]] std::shared_ptr<Chain> create_chain(ChainType type, Error& error_out);

    /// Alias of create_chain
    [[nodiscard]] std::shared_ptr<Chain> build_chain(ChainType type, Error& error_out) {
        return create_chain(type, error_out);
    }

    /// Build the chain for a chain type, specialized for a request path
    ///   1. units whose `paths` match are added (re-sorted by priority)
    ///   2. units whose `exclude_paths` match are removed
    ///   3. units with non-empty `include_paths` that do not match are removed
    [[nodiscard]] std::shared_ptr<Chain> build_chain_for_path(ChainType type,
                                                              std::string_view path,
                                                              Error& error_out);

    /// Cached build_chain_for_path, keyed "path:<type>:<path>"
    /// A hit returns the same chain object; concurrent cold lookups may both
    /// build, and the first inserted chain is the one every caller keeps.
    /// Once the cache holds max_cached_paths entries, new paths get a fresh
    /// uncached chain (counted in CacheStats::uncached_builds); stored entries
    /// keep being returned.
    [[nodiscard]] std::shared_ptr<const Chain> get_chain_for_path(ChainType type,
                                                                  std::string_view path,
                                                                  Error& error_out);

    // Named chains (independent of the path cache)

    [[nodiscard]] std::shared_ptr<Chain> get_chain(std::string_view name) const;

    [[nodiscard]] Error register_chain(std::string name, std::shared_ptr<Chain> chain);

    /// Named chain handles, sorted
    [[nodiscard]] std::vector<std::string> list_chains() const;

    bool remove_chain(std::string_view name);

    /// Drop every path cache entry (named chains and registry untouched)
    void clear_cache();

    /// Startup check: registry dependencies, then every chain type builds
    [[nodiscard]] Error validate_configuration();

    /// Read-only descriptor (resolved units are empty when the build fails)
    [[nodiscard]] ChainInfo get_chain_info(ChainType type);

    /// Last build duration per chain type name
    [[nodiscard]] std::map<std::string, BuildDuration> get_chain_performance() const;

    [[nodiscard]] CacheStats get_cache_stats() const;

    [[nodiscard]] static std::string cache_key(ChainType type, std::string_view path);

    [[nodiscard]] const PathMatcher& path_matcher() const noexcept { return matcher_; }

private:
    /// Collect, filter and validate the units of a chain type
    [[nodiscard]] bool assemble(ChainType type, std::vector<RegisteredUnit>& units,
                                Error& error_out) const;

    /// Path specialization of an assembled unit list
    void specialize_for_path(std::vector<RegisteredUnit>& units, std::string_view path) const;

    [[nodiscard]] std::shared_ptr<Chain> make_chain(ChainType type,
                                                    const std::vector<RegisteredUnit>& units,
                                                    BuildDuration elapsed) const;

    void record_build_time(ChainType type, BuildDuration elapsed);

    Registry& registry_;
    const control::ConfigProvider& config_;
    quill::Logger* logger_;

    PathMatcher matcher_;

    const size_t max_cached_paths_;
    std::atomic<uint64_t> uncached_builds_{0};

    mutable std::shared_mutex cache_mutex_;
    core::fast_map<std::string, std::shared_ptr<const Chain>> path_cache_;

    mutable std::shared_mutex named_mutex_;
    core::fast_map<std::string, std::shared_ptr<Chain>> named_chains_;

    mutable std::mutex build_mutex_;
    core::fast_map<std::string, BuildDuration> build_times_;
};

}  // namespace conduit::pipeline

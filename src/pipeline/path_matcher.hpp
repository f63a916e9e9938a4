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

// Conduit Path Matcher - Header
// Request path against configured path patterns

#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../http/regex.hpp"

namespace conduit::pipeline {

/// Which strategy accepted a pattern (None when nothing matched)
enum class MatchKind : uint8_t {
    None,
    Exact,
    Prefix,
    Glob,
    Shell
};

/// Path pattern matcher
///
/// Strategies are tried in this order, first success wins:
///   1. exact string equality
///   2. prefix: "/api/*" matches "/api" followed by anything
///   3. glob: any other pattern containing '*' becomes an anchored regex
///      ('*' -> ".*", everything else literal)
///   4. shell pattern via fnmatch(FNM_PATHNAME): '*' and '?' stay within a
///      segment, [...] classes supported
/// An invalid pattern never matches.
///
/// Thread-safe: compiled globs are cached behind a shared_mutex.
class PathMatcher {
public:
    PathMatcher() = default;

    PathMatcher(const PathMatcher&) = delete;
    PathMatcher& operator=(const PathMatcher&) = delete;

    [[nodiscard]] bool matches(std::string_view pattern, std::string_view path) const {
        return match(pattern, path) != MatchKind::None;
    }

    /// Strategy that matched, for diagnostics and tests
    [[nodiscard]] MatchKind match(std::string_view pattern, std::string_view path) const;

    /// True when any pattern matches
    [[nodiscard]] bool matches_any(const std::vector<std::string>& patterns,
                                   std::string_view path) const;

    /// Number of compiled glob expressions currently cached
    [[nodiscard]] size_t cached_patterns() const;

private:
    [[nodiscard]] bool glob_matches(std::string_view pattern, std::string_view path) const;

    // nullptr entry marks a pattern that failed to compile
    mutable std::shared_mutex mutex_;
    mutable core::fast_map<std::string, std::shared_ptr<const http::Regex>> compiled_;
};

}  // namespace conduit::pipeline

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

// Conduit Path Matcher - Implementation

#include "path_matcher.hpp"

#include <fnmatch.h>

#include <mutex>

namespace conduit::pipeline {

namespace {

// "/a/*/b" -> "^/a/.*/b$"
std::string glob_to_regex(std::string_view pattern) {
    std::string regex = "^";
    size_t start = 0;
    while (true) {
        size_t star = pattern.find('*', start);
        if (star == std::string_view::npos) {
            regex += http::Regex::quote(pattern.substr(start));
            break;
        }
        regex += http::Regex::quote(pattern.substr(start, star - start));
        regex += ".*";
        start = star + 1;
    }
    regex += '$';
    return regex;
}

}  // namespace

MatchKind PathMatcher::match(std::string_view pattern, std::string_view path) const {
    if (pattern.empty()) {
        return MatchKind::None;
    }

    if (pattern == path) {
        return MatchKind::Exact;
    }

    if (pattern.ends_with("/*")) {
        std::string_view prefix = pattern.substr(0, pattern.size() - 2);
        if (path.starts_with(prefix)) {
            return MatchKind::Prefix;
        }
    }

    if (pattern.find('*') != std::string_view::npos && glob_matches(pattern, path)) {
        return MatchKind::Glob;
    }

    // fnmatch needs NUL-terminated strings
    std::string pattern_str(pattern);
    std::string path_str(path);
    if (fnmatch(pattern_str.c_str(), path_str.c_str(), FNM_PATHNAME) == 0) {
        return MatchKind::Shell;
    }

    return MatchKind::None;
}

bool PathMatcher::matches_any(const std::vector<std::string>& patterns,
                              std::string_view path) const {
    for (const auto& pattern : patterns) {
        if (matches(pattern, path)) {
            return true;
        }
    }
    return false;
}

size_t PathMatcher::cached_patterns() const {
    std::shared_lock lock(mutex_);
    return compiled_.size();
}

bool PathMatcher::glob_matches(std::string_view pattern, std::string_view path) const {
    std::string key(pattern);
    std::shared_ptr<const http::Regex> regex;
    bool cached = false;

    {
        std::shared_lock lock(mutex_);
        auto it = compiled_.find(key);
        if (it != compiled_.end()) {
            regex = it->second;
            cached = true;
        }
    }

    if (!cached) {
        auto compiled = http::Regex::compile(glob_to_regex(pattern));
        if (compiled) {
            regex = std::make_shared<const http::Regex>(std::move(*compiled));
        }

        std::unique_lock lock(mutex_);
        // First insert wins when two threads compiled the same pattern
        regex = compiled_.try_emplace(std::move(key), regex).first->second;
    }

    return regex && regex->matches(path);
}

}  // namespace conduit::pipeline

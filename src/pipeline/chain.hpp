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

// Conduit Chain - Header
// Ordered, mutable sequence of middleware units with single-pass execution

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "../core/logging.hpp"
#include "middleware.hpp"

namespace conduit::pipeline {

/// Middleware chain
///
/// Units run in stored order. add/insert/remove never re-sort; priority
/// ordering is applied once by the Orchestrator when it builds a chain.
/// Mutation is not synchronized: chains handed out from caches are const
/// and may be processed concurrently.
class Chain {
public:
    Chain() = default;
    explicit Chain(std::vector<MiddlewarePtr> units, quill::Logger* logger = nullptr)
        : units_(std::move(units)), logger_(logger) {}

    /// Run the request through every unit; the end of the chain yields an empty 404
    [[nodiscard]] http::Response process(Context& ctx, http::Request& req) const;

    /// Run the request through every unit, then the terminal handler
    [[nodiscard]] http::Response process(Context& ctx, http::Request& req,
                                         const Handler& terminal) const;

    /// Append units to the end
    Chain& add(MiddlewarePtr unit);
    Chain& add(const std::vector<MiddlewarePtr>& units);

    /// Insert units at position (0 = front, -1 or out of range = back)
    Chain& insert(int position, MiddlewarePtr unit);
    Chain& insert(int position, const std::vector<MiddlewarePtr>& units);

    /// Remove the first unit with this name
    bool remove(std::string_view name);

    /// First unit with this name, or nullptr
    [[nodiscard]] MiddlewarePtr get(std::string_view name) const;

    /// Units in execution order (copy)
    [[nodiscard]] std::vector<MiddlewarePtr> list() const { return units_; }

    /// Unit names in execution order
    [[nodiscard]] std::vector<std::string> names() const;

    Chain& clear() {
        units_.clear();
        return *this;
    }

    [[nodiscard]] size_t length() const noexcept { return units_.size(); }

    [[nodiscard]] bool contains(std::string_view name) const { return get(name) != nullptr; }

private:
    http::Response run(size_t index, Context& ctx, http::Request& req,
                       const Handler* terminal) const;

    std::vector<MiddlewarePtr> units_;
    quill::Logger* logger_ = nullptr;
};

}  // namespace conduit::pipeline

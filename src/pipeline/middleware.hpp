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

// Conduit Middleware - Header
// Execution contract shared by every unit placed in a chain

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "../core/containers.hpp"
#include "../http/http.hpp"
#include "types.hpp"

namespace conduit::pipeline {

/// Per-request context (forwarded untouched to every unit)
struct Context {
    std::string correlation_id;

    // Connection info
    std::string client_ip;

    // Metadata (for middleware communication)
    core::fast_map<std::string, std::string> metadata;

    // Timing
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    // Error handling
    bool has_error = false;
    std::string error_message;

    /// Helper: Set error
    void set_error(std::string message) {
        has_error = true;
        error_message = std::move(message);
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }
};

/// Continuation handed to a unit: runs the rest of the chain
using Next = std::function<http::Response()>;

/// Terminal handler run after the last unit
using Handler = std::function<http::Response(Context&, http::Request&)>;

/// Middleware unit base class
///
/// A unit either returns its own response without calling next (short-circuit)
/// or calls next exactly once and returns (optionally modifying) its result.
/// next is only valid during process(): a copy kept and called after process()
/// returns is undefined behavior.
class Middleware {
public:
    virtual ~Middleware() = default;

    [[nodiscard]] virtual http::Response process(Context& ctx, http::Request& req,
                                                 const Next& next) = 0;

    /// Unique name (registry key)
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Lower runs earlier; configuration may override
    [[nodiscard]] virtual int priority() const { return kDefaultPriority; }
};

using MiddlewarePtr = std::shared_ptr<Middleware>;

/// Middleware function signature
using MiddlewareFunc = std::function<http::Response(Context&, http::Request&, const Next&)>;

/// Function middleware wrapper
class FunctionMiddleware : public Middleware {
public:
    FunctionMiddleware(std::string name, int priority, MiddlewareFunc func)
        : name_(std::move(name)), priority_(priority), func_(std::move(func)) {}

    http::Response process(Context& ctx, http::Request& req, const Next& next) override {
        return func_(ctx, req, next);
    }

    std::string_view name() const override { return name_; }

    int priority() const override { return priority_; }

private:
    std::string name_;
    int priority_;
    MiddlewareFunc func_;
};

/// Create a shared FunctionMiddleware
[[nodiscard]] inline MiddlewarePtr make_function_middleware(std::string name, int priority,
                                                           MiddlewareFunc func) {
    return std::make_shared<FunctionMiddleware>(std::move(name), priority, std::move(func));
}

}  // namespace conduit::pipeline

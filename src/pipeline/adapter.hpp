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

// Conduit Adapter - Header
// Maps request paths to chain types and runs requests through cached chains

#pragma once

#include <memory>
#include <string_view>

#include "../core/logging.hpp"
#include "orchestrator.hpp"

namespace conduit::pipeline {

/// Transport-facing entry point
class Adapter {
public:
    explicit Adapter(Orchestrator& orchestrator, quill::Logger* logger = nullptr)
        : orchestrator_(orchestrator), logger_(logger) {}

    /// Chain type for a request path
    ///   /api                                  -> API
    ///   /dashboard, /forms                    -> Web
    ///   /login, /signup, /logout,
    ///   /forgot-password, /reset-password     -> Auth (exact)
    ///   /admin                                -> Admin
    ///   /public                               -> Public
    ///   /static, /assets                      -> Static
    ///   anything else                         -> Default
    /// Prefixes match whole segments ("/api/x" is API, "/apiary" is not).
    [[nodiscard]] static ChainType resolve_chain_type(std::string_view path) noexcept;

    /// Build every chain type once and register it as a named chain under its type name
    [[nodiscard]] Error setup_chains();

    /// Resolve, fetch the cached chain and run the request through it
    /// A chain that fails to build yields 500 Internal Server Error.
    /// Assigns a correlation id when the context has none.
    [[nodiscard]] http::Response dispatch(Context& ctx, http::Request& req,
                                          const Handler& terminal);

    /// Cached chain for a path (nullptr with error_out filled when the build fails)
    [[nodiscard]] std::shared_ptr<const Chain> chain_for(std::string_view path, Error& error_out);

private:
    Orchestrator& orchestrator_;
    quill::Logger* logger_;
};

}  // namespace conduit::pipeline

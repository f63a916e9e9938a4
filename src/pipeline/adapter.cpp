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

// Conduit Adapter - Implementation

#include "adapter.hpp"

#include "../core/string_utils.hpp"

namespace conduit::pipeline {

ChainType Adapter::resolve_chain_type(std::string_view path) noexcept {
    using core::has_path_prefix;

    if (has_path_prefix(path, "/api")) {
        return ChainType::API;
    }
    if (has_path_prefix(path, "/dashboard") || has_path_prefix(path, "/forms")) {
        return ChainType::Web;
    }
    if (path == "/login" || path == "/signup" || path == "/logout" ||
        path == "/forgot-password" || path == "/reset-password") {
        return ChainType::Auth;
    }
    if (has_path_prefix(path, "/admin")) {
        return ChainType::Admin;
    }
    if (has_path_prefix(path, "/public")) {
        return ChainType::Public;
    }
    if (has_path_prefix(path, "/static") || has_path_prefix(path, "/assets")) {
        return ChainType::Static;
    }
    return ChainType::Default;
}

Error Adapter::setup_chains() {
    for (auto type : all_chain_types()) {
        std::string name(to_string(type));

        Error error;
        auto chain = orchestrator_.create_chain(type, error);
        if (!chain) {
            CONDUIT_LOG_ERROR(logger_, "Failed to build chain: chain_type={}, error={}", name,
                              error.message);
            return error;
        }

        error = orchestrator_.register_chain(name, std::move(chain));
        if (error) {
            CONDUIT_LOG_ERROR(logger_, "Failed to register chain: chain_type={}, error={}", name,
                              error.message);
            return error;
        }
    }

    CONDUIT_LOG_INFO(logger_, "Middleware chains ready: count={}", all_chain_types().size());
    return {};
}

std::shared_ptr<const Chain> Adapter::chain_for(std::string_view path, Error& error_out) {
    return orchestrator_.get_chain_for_path(resolve_chain_type(path), path, error_out);
}

http::Response Adapter::dispatch(Context& ctx, http::Request& req, const Handler& terminal) {
    if (ctx.correlation_id.empty()) {
        ctx.correlation_id = logging::generate_correlation_id();
    }

    Error error;
    auto chain = chain_for(req.path, error);
    if (!chain) {
        ctx.set_error(error.message);
        CONDUIT_LOG_ERROR(logger_, "Chain unavailable: path={}, correlation_id={}, error={}",
                          req.path, ctx.correlation_id, error.message);

        http::Response response(http::StatusCode::InternalServerError);
        response.set_body(std::string(http::to_reason_phrase(response.status)), "text/plain");
        return response;
    }

    return chain->process(ctx, req, terminal);
}

}  // namespace conduit::pipeline

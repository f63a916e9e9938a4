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

// Conduit Chain - Implementation

#include "chain.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace conduit::pipeline {

http::Response Chain::process(Context& ctx, http::Request& req) const {
    return run(0, ctx, req, nullptr);
}

http::Response Chain::process(Context& ctx, http::Request& req, const Handler& terminal) const {
    return run(0, ctx, req, terminal ? &terminal : nullptr);
}

http::Response Chain::run(size_t index, Context& ctx, http::Request& req,
                          const Handler* terminal) const {
    if (index >= units_.size()) {
        if (terminal) {
            return (*terminal)(ctx, req);
        }
        return http::Response(http::StatusCode::NotFound);
    }

    const MiddlewarePtr& unit = units_[index];
    bool called = false;

    // Captures locals by reference: only valid while unit->process() runs
    Next next = [this, index, &ctx, &req, terminal, &unit, &called]() -> http::Response {
        if (called) {
            // Downstream units already ran once for this request
            ctx.set_error(
                fmt::format("middleware '{}' invoked its continuation more than once", unit->name()));
            CONDUIT_LOG_ERROR(logger_,
                              "Continuation invoked twice: middleware={}, correlation_id={}",
                              std::string(unit->name()), ctx.correlation_id);
            return http::Response(http::StatusCode::InternalServerError);
        }
        called = true;
        return run(index + 1, ctx, req, terminal);
    };

    return unit->process(ctx, req, next);
}

Chain& Chain::add(MiddlewarePtr unit) {
    units_.push_back(std::move(unit));
    return *this;
}

Chain& Chain::add(const std::vector<MiddlewarePtr>& units) {
    units_.insert(units_.end(), units.begin(), units.end());
    return *this;
}

Chain& Chain::insert(int position, MiddlewarePtr unit) {
    return insert(position, std::vector<MiddlewarePtr>{std::move(unit)});
}

Chain& Chain::insert(int position, const std::vector<MiddlewarePtr>& units) {
    size_t offset = units_.size();
    if (position >= 0 && static_cast<size_t>(position) <= units_.size()) {
        offset = static_cast<size_t>(position);
    }
    units_.insert(units_.begin() + static_cast<std::ptrdiff_t>(offset), units.begin(),
                  units.end());
    return *this;
}

bool Chain::remove(std::string_view name) {
    auto it = std::find_if(units_.begin(), units_.end(),
                           [name](const MiddlewarePtr& unit) { return unit->name() == name; });
    if (it == units_.end()) {
        return false;
    }
    units_.erase(it);
    return true;
}

MiddlewarePtr Chain::get(std::string_view name) const {
    for (const auto& unit : units_) {
        if (unit->name() == name) {
            return unit;
        }
    }
    return nullptr;
}

std::vector<std::string> Chain::names() const {
    std::vector<std::string> result;
    result.reserve(units_.size());
    for (const auto& unit : units_) {
        result.emplace_back(unit->name());
    }
    return result;
}

}  // namespace conduit::pipeline

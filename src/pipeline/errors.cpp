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

// Conduit Pipeline Errors - Implementation

#include "errors.hpp"

#include <fmt/format.h>

namespace conduit::pipeline {

std::string PipelineErrorCategory::message(int ev) const {
    switch (static_cast<Errc>(ev)) {
        case Errc::AlreadyRegistered:
            return "middleware already registered";
        case Errc::MissingDependency:
            return "missing middleware dependency";
        case Errc::ConflictingUnit:
            return "conflicting middleware present";
        case Errc::ChainValidationFailed:
            return "chain validation failed";
        case Errc::AlreadyExists:
            return "chain already exists";
    }
    return "unknown pipeline error";
}

const PipelineErrorCategory& pipeline_category() noexcept {
    static PipelineErrorCategory instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), pipeline_category()};
}

Error make_error(Errc code, std::string message) {
    Error error;
    error.code = make_error_code(code);
    error.message = std::move(message);
    return error;
}

Error wrap_error(Errc code, const Error& inner, std::string context) {
    Error error;
    error.code = make_error_code(code);
    error.cause = inner.cause ? inner.cause : inner.code;
    error.message = fmt::format("{}: {}", context, inner.message);
    return error;
}

}  // namespace conduit::pipeline

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

// Conduit Pipeline Errors - Header
// std::error_code category for registry, chain building and named chains

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace conduit::pipeline {

/// Pipeline error codes (0 is reserved for success)
enum class Errc {
    AlreadyRegistered = 1,  // Duplicate unit name at register_unit
    MissingDependency,      // Declared dependency absent from scope
    ConflictingUnit,        // Declared conflict present in scope
    ChainValidationFailed,  // Chain build rejected; cause carries the reason
    AlreadyExists,          // Duplicate named chain
};

/// Pipeline error category for std::error_code
class PipelineErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "conduit.pipeline"; }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get pipeline error category instance
[[nodiscard]] const PipelineErrorCategory& pipeline_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

/// Error value returned by fallible pipeline operations
/// An empty (default) Error means success.
struct Error {
    std::error_code code;
    std::error_code cause;  // Underlying reason when code wraps another error
    std::string message;

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(code); }

    /// True when either the error itself or its cause equals e
    [[nodiscard]] bool is(Errc e) const noexcept {
        return code == make_error_code(e) || cause == make_error_code(e);
    }
};

/// Build an Error with a formatted message
[[nodiscard]] Error make_error(Errc code, std::string message);

/// Wrap an existing error under a new code, keeping its code as the cause
[[nodiscard]] Error wrap_error(Errc code, const Error& inner, std::string context);

}  // namespace conduit::pipeline

template <>
struct std::is_error_code_enum<conduit::pipeline::Errc> : std::true_type {};

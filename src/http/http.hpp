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

// Conduit HTTP Values - Header
// Transport-agnostic request/response value types (owned storage)

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP status codes
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    NotModified = 304,
    TemporaryRedirect = 307,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    TooManyRequests = 429,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (name-value pair, owned)
struct Header {
    std::string name;
    std::string value;
};

/// Cookie (request side: name/value; response side may carry attributes)
struct Cookie {
    std::string name;
    std::string value;
    std::string path;
    int max_age = 0;
    bool http_only = false;
    bool secure = false;
};

/// HTTP request as seen by middleware
struct Request {
    Method method = Method::UNKNOWN;

    std::string path;   // URI without query string
    std::string query;  // Query string (if present)

    std::vector<Header> headers;
    std::vector<Cookie> cookies;

    std::string body;

    std::string remote_addr;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Replace the value of an existing header or append a new one
    void set_header(std::string_view name, std::string_view value);

    [[nodiscard]] const Cookie* find_cookie(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view content_type() const noexcept {
        return get_header("Content-Type");
    }

    /// Request targets a JSON API (Accept or Content-Type mentions application/json)
    [[nodiscard]] bool wants_json() const noexcept;
};

/// HTTP response produced by a chain
struct Response {
    StatusCode status = StatusCode::OK;

    std::vector<Header> headers;
    std::vector<Cookie> cookies;

    std::string body;

    Response() = default;
    explicit Response(StatusCode code) : status(code) {}

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Replace the value of an existing header or append a new one
    Response& set_header(std::string_view name, std::string_view value);

    /// Append a header even if one with the same name exists
    Response& add_header(std::string_view name, std::string_view value);

    /// Remove all headers with this name; true if any were removed
    bool remove_header(std::string_view name);

    Response& set_cookie(Cookie cookie);

    Response& set_body(std::string content, std::string_view content_type);

    [[nodiscard]] bool is_error() const noexcept {
        return static_cast<uint16_t>(status) >= 400;
    }

    [[nodiscard]] bool is_redirect() const noexcept {
        auto code = static_cast<uint16_t>(status);
        return code >= 300 && code < 400;
    }
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace conduit::http

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

// Conduit HTTP Values - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>

namespace conduit::http {

namespace {

template <typename Headers>
auto find_in(Headers& headers, std::string_view name) {
    return std::find_if(headers.begin(), headers.end(),
                        [name](const Header& h) { return header_name_equals(h.name, name); });
}

}  // namespace

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    auto it = find_in(headers, name);
    return it != headers.end() ? &*it : nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Request::set_header(std::string_view name, std::string_view value) {
    auto it = find_in(headers, name);
    if (it != headers.end()) {
        it->value = std::string(value);
        return;
    }
    headers.push_back(Header{std::string(name), std::string(value)});
}

const Cookie* Request::find_cookie(std::string_view name) const noexcept {
    for (const auto& cookie : cookies) {
        if (cookie.name == name) {
            return &cookie;
        }
    }
    return nullptr;
}

bool Request::wants_json() const noexcept {
    return get_header("Accept").find("application/json") != std::string_view::npos ||
           content_type().find("application/json") != std::string_view::npos;
}

// Response helper methods

const Header* Response::find_header(std::string_view name) const noexcept {
    auto it = find_in(headers, name);
    return it != headers.end() ? &*it : nullptr;
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

Response& Response::set_header(std::string_view name, std::string_view value) {
    auto it = find_in(headers, name);
    if (it != headers.end()) {
        it->value = std::string(value);
    } else {
        headers.push_back(Header{std::string(name), std::string(value)});
    }
    return *this;
}

Response& Response::add_header(std::string_view name, std::string_view value) {
    headers.push_back(Header{std::string(name), std::string(value)});
    return *this;
}

bool Response::remove_header(std::string_view name) {
    auto it = std::remove_if(headers.begin(), headers.end(),
                             [name](const Header& h) { return header_name_equals(h.name, name); });
    if (it == headers.end()) {
        return false;
    }
    headers.erase(it, headers.end());
    return true;
}

Response& Response::set_cookie(Cookie cookie) {
    cookies.push_back(std::move(cookie));
    return *this;
}

Response& Response::set_body(std::string content, std::string_view content_type) {
    body = std::move(content);
    set_header("Content-Type", content_type);
    set_header("Content-Length", std::to_string(body.size()));
    return *this;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    static constexpr std::pair<std::string_view, Method> kMethods[] = {
        {"GET", Method::GET},         {"POST", Method::POST},       {"PUT", Method::PUT},
        {"DELETE", Method::DELETE},   {"HEAD", Method::HEAD},       {"OPTIONS", Method::OPTIONS},
        {"PATCH", Method::PATCH},     {"CONNECT", Method::CONNECT}, {"TRACE", Method::TRACE},
    };

    for (const auto& [name, method] : kMethods) {
        if (str == name) {
            return method;
        }
    }
    return Method::UNKNOWN;
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::Accepted:
            return "Accepted";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::MovedPermanently:
            return "Moved Permanently";
        case StatusCode::Found:
            return "Found";
        case StatusCode::SeeOther:
            return "See Other";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::TemporaryRedirect:
            return "Temporary Redirect";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

}  // namespace conduit::http

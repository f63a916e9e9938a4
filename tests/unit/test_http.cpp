// Conduit HTTP Value Types Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/http/http.hpp"

using namespace conduit::http;

TEST_CASE("Method parsing and formatting", "[http][method]") {
    REQUIRE(parse_method("GET") == Method::GET);
    REQUIRE(parse_method("DELETE") == Method::DELETE);
    REQUIRE(parse_method("OPTIONS") == Method::OPTIONS);
    REQUIRE(parse_method("get") == Method::UNKNOWN);
    REQUIRE(parse_method("") == Method::UNKNOWN);

    REQUIRE(to_string(Method::PATCH) == "PATCH");
    REQUIRE(to_string(Method::UNKNOWN) == "UNKNOWN");
}

TEST_CASE("Status reason phrases", "[http][status]") {
    REQUIRE(to_reason_phrase(StatusCode::OK) == "OK");
    REQUIRE(to_reason_phrase(StatusCode::NotFound) == "Not Found");
    REQUIRE(to_reason_phrase(StatusCode::TooManyRequests) == "Too Many Requests");
    REQUIRE(to_reason_phrase(StatusCode::InternalServerError) == "Internal Server Error");
}

TEST_CASE("Request header and cookie access", "[http][request]") {
    Request req;
    req.method = Method::POST;
    req.path = "/api/forms";
    req.headers = {{"Content-Type", "application/json"}, {"X-Request-Id", "abc"}};
    req.cookies = {{"session", "s1", "/", 0, true, true}};

    SECTION("header lookup is case-insensitive") {
        REQUIRE(req.has_header("content-type"));
        REQUIRE(req.get_header("X-REQUEST-ID") == "abc");
        REQUIRE(req.get_header("Missing", "fallback") == "fallback");
        REQUIRE(req.find_header("missing") == nullptr);
    }

    SECTION("set_header replaces existing value") {
        req.set_header("x-request-id", "def");
        REQUIRE(req.headers.size() == 2);
        REQUIRE(req.get_header("X-Request-Id") == "def");

        req.set_header("Accept", "text/html");
        REQUIRE(req.headers.size() == 3);
    }

    SECTION("cookies") {
        const Cookie* cookie = req.find_cookie("session");
        REQUIRE(cookie != nullptr);
        REQUIRE(cookie->value == "s1");
        REQUIRE(req.find_cookie("Session") == nullptr);
    }

    SECTION("content negotiation") {
        REQUIRE(req.content_type() == "application/json");
        REQUIRE(req.wants_json());

        Request html;
        html.headers = {{"Accept", "text/html"}};
        REQUIRE_FALSE(html.wants_json());
    }
}

TEST_CASE("Response helpers", "[http][response]") {
    Response resp(StatusCode::Created);
    REQUIRE(resp.status == StatusCode::Created);
    REQUIRE_FALSE(resp.is_error());
    REQUIRE_FALSE(resp.is_redirect());

    SECTION("set_body sets content headers") {
        resp.set_body("hello", "text/plain");
        REQUIRE(resp.body == "hello");
        REQUIRE(resp.get_header("content-type") == "text/plain");
        REQUIRE(resp.get_header("Content-Length") == "5");
    }

    SECTION("add_header keeps duplicates, remove_header drops all") {
        resp.add_header("Vary", "Origin").add_header("vary", "Accept");
        REQUIRE(resp.headers.size() == 2);

        REQUIRE(resp.remove_header("VARY"));
        REQUIRE(resp.headers.empty());
        REQUIRE_FALSE(resp.remove_header("Vary"));
    }

    SECTION("set_header is chainable and replaces") {
        resp.set_header("X-Frame-Options", "DENY").set_header("x-frame-options", "SAMEORIGIN");
        REQUIRE(resp.headers.size() == 1);
        REQUIRE(resp.get_header("X-Frame-Options") == "SAMEORIGIN");
    }

    SECTION("status classes") {
        REQUIRE(Response(StatusCode::Forbidden).is_error());
        REQUIRE(Response(StatusCode::Found).is_redirect());
        REQUIRE_FALSE(Response(StatusCode::NotModified).is_error());
    }

    SECTION("cookies") {
        Cookie cookie;
        cookie.name = "csrf_token";
        cookie.value = "t";
        cookie.http_only = true;
        resp.set_cookie(cookie);
        REQUIRE(resp.cookies.size() == 1);
        REQUIRE(resp.cookies[0].http_only);
    }
}

TEST_CASE("Header name comparison", "[http][headers]") {
    REQUIRE(header_name_equals("Content-Type", "content-type"));
    REQUIRE_FALSE(header_name_equals("Content-Type", "Content-Length"));
    REQUIRE_FALSE(header_name_equals("Accept", "Accept-Encoding"));
}

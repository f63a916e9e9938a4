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

// Config Validator Unit Tests - name security, references and typo suggestions

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/control/config_validator.hpp"

using namespace conduit::control;

namespace {

bool any_contains(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Middleware name security", "[control][validator][security]") {
    SECTION("accepted names") {
        REQUIRE(ConfigValidator::check_name("rate-limit").empty());
        REQUIRE(ConfigValidator::check_name("security_headers").empty());
        REQUIRE(ConfigValidator::check_name("Auth2").empty());
        REQUIRE(ConfigValidator::check_name(std::string(MAX_MIDDLEWARE_NAME_LENGTH, 'a')).empty());
    }

    SECTION("rejected names") {
        REQUIRE(ConfigValidator::check_name("") == "Middleware name cannot be empty");
        REQUIRE(ConfigValidator::check_name(std::string(MAX_MIDDLEWARE_NAME_LENGTH + 1, 'a'))
                    .find("too long") != std::string::npos);
        REQUIRE(ConfigValidator::check_name(std::string("bad\0name", 8)) == "Null byte detected");
        REQUIRE(ConfigValidator::check_name("bad\nname") == "Line breaks not allowed");
        REQUIRE_FALSE(ConfigValidator::check_name("../etc/passwd").empty());
        REQUIRE_FALSE(ConfigValidator::check_name("a;rm -rf").empty());
        REQUIRE_FALSE(ConfigValidator::check_name("cors ").empty());
    }

    SECTION("invalid configured names are errors") {
        Config config;
        config.middleware["good"] = UnitConfig{};
        config.middleware["bad name"] = UnitConfig{};
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(any_contains(result.errors, "Invalid middleware name 'bad name'"));
    }

    SECTION("too many configured units") {
        Config config;
        for (size_t i = 0; i <= MAX_REGISTERED_MIDDLEWARE; ++i) {
            config.middleware["unit-" + std::to_string(i)] = UnitConfig{};
        }
        auto result = ConfigValidator::validate(config);
        REQUIRE(any_contains(result.errors, "Too many configured middleware"));
    }
}

TEST_CASE("Dependency and conflict references", "[control][validator]") {
    Config config;
    config.middleware["session"] = UnitConfig{};
    config.middleware["authentication"] = UnitConfig{};

    SECTION("valid references") {
        config.middleware["authorization"].dependencies = {"authentication"};
        config.middleware["csrf"].dependencies = {"session"};
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(result.warnings.empty());
    }

    SECTION("self dependency") {
        config.middleware["session"].dependencies = {"session"};
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.errors == std::vector<std::string>{"Middleware 'session' depends on itself"});
    }

    SECTION("self conflict") {
        config.middleware["session"].conflicts = {"session"};
        auto result = ConfigValidator::validate(config);
        REQUIRE(any_contains(result.errors, "conflicts with itself"));
    }

    SECTION("depends on and conflicts with the same unit") {
        config.middleware["csrf"].dependencies = {"session"};
        config.middleware["csrf"].conflicts = {"session"};
        auto result = ConfigValidator::validate(config);
        REQUIRE(any_contains(result.errors,
                             "Middleware 'csrf' both depends on and conflicts with 'session'"));
    }

    SECTION("unconfigured dependency warns with a suggestion") {
        config.middleware["authorization"].dependencies = {"authentcation"};
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0] ==
                "Middleware 'authorization': dependency 'authentcation' is not configured. "
                "Did you mean: authentication");
    }

    SECTION("unconfigured conflict without a close match") {
        config.middleware["csrf"].conflicts = {"no-csrf"};
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.warnings ==
                std::vector<std::string>{"Middleware 'csrf': conflict 'no-csrf' is not configured"});
    }

    SECTION("overlong typo gets no suggestion") {
        std::string typo(MAX_MIDDLEWARE_NAME_LENGTH + 10, 's');
        config.middleware["csrf"].dependencies = {typo};
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0].find("Did you mean") == std::string::npos);
    }
}

TEST_CASE("Chain table references", "[control][validator]") {
    Config config;
    config.middleware["session"] = UnitConfig{};

    SECTION("known chain types") {
        config.chains["api"].middleware = {"session"};
        config.chains["static"] = ChainConfig{};
        REQUIRE_FALSE(ConfigValidator::validate(config).has_errors());
    }

    SECTION("unknown chain type suggests the closest") {
        config.chains["admn"] = ChainConfig{};
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(result.errors[0] == "Unknown chain type 'admn'. Did you mean: admin");
    }

    SECTION("allow-list names an unconfigured unit") {
        config.chains["web"].middleware = {"sesion"};
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(result.warnings ==
                std::vector<std::string>{
                    "Chain 'web': middleware 'sesion' is not configured. Did you mean: session"});
    }

    SECTION("allow-list with an invalid name") {
        config.chains["web"].middleware = {"sess;ion"};
        auto result = ConfigValidator::validate(config);
        REQUIRE(any_contains(result.errors, "Chain 'web': invalid middleware name 'sess;ion'"));
    }
}

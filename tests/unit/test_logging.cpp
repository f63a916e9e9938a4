// Conduit Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

using namespace conduit::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("generates valid UUID format") {
        std::string correlation_id = generate_correlation_id();

        // Should contain exactly one '#' separator
        size_t hash_count = std::count(correlation_id.begin(), correlation_id.end(), '#');
        REQUIRE(hash_count == 1);

        REQUIRE(is_valid_uuid(correlation_id));
    }

    SECTION("same base per thread, distinct counters") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();

        REQUIRE(id1 != id2);

        size_t hash_pos1 = id1.find('#');
        size_t hash_pos2 = id2.find('#');
        REQUIRE(id1.substr(0, hash_pos1) == id2.substr(0, hash_pos2));
        REQUIRE(id1.substr(hash_pos1 + 1) != id2.substr(hash_pos2 + 1));
    }

    SECTION("many ids are unique") {
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            ids.insert(generate_correlation_id());
        }
        REQUIRE(ids.size() == 1000);
    }
}

TEST_CASE("UUID validation", "[logging][validation]") {
    SECTION("accepts valid correlation IDs") {
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#999999"));
        REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));
    }

    SECTION("rejects invalid formats") {
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#12a"));
        REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));

        // Wrong version digit
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));

        // Wrong variant
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));

        // Non-hex character
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-44665544000g#0"));
    }
}

TEST_CASE("Logger initialization", "[logging][init]") {
    const std::filesystem::path log_dir = "/tmp/conduit_tests/logger_init";

    SECTION("text file sink writes under the output directory") {
        conduit::control::LogConfig config;
        config.level = "warning";
        config.format = "text";
        config.output = log_dir.string();

        quill::Logger* logger = init_logger("conduit_text_logger", config);
        REQUIRE(logger != nullptr);
        REQUIRE(get_current_logger() == logger);
        REQUIRE(logger->get_log_level() == quill::LogLevel::Warning);
        REQUIRE(std::filesystem::exists(log_dir / "conduit_text_logger.log"));
    }

    SECTION("json file sink") {
        conduit::control::LogConfig config;
        config.format = "json";
        config.output = log_dir.string();

        quill::Logger* logger = init_logger("conduit_json_logger", config);
        REQUIRE(logger != nullptr);
        REQUIRE(logger->get_log_level() == quill::LogLevel::Info);
        REQUIRE(std::filesystem::exists(log_dir / "conduit_json_logger.log"));
    }

    SECTION("console sink") {
        conduit::control::LogConfig config;
        config.level = "ERROR";
        config.output = "console";

        quill::Logger* logger = init_logger("conduit_console_logger", config);
        REQUIRE(logger != nullptr);
        REQUIRE(logger->get_log_level() == quill::LogLevel::Error);
    }

    SECTION("null logger is accepted by the conduit macros") {
        quill::Logger* logger = nullptr;
        CONDUIT_LOG_INFO(logger, "dropped: value={}", 42);
        CONDUIT_LOG_ERROR(logger, "dropped: name={}", std::string("x"));
        SUCCEED();
    }
}

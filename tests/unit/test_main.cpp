// Conduit Unit Tests - Main Entry Point
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        // Initialize logging system for tests
        conduit::logging::init_logging_system();

        conduit::control::LogConfig log_config;
        log_config.level = "debug";
        log_config.output = "/tmp/conduit_tests";
        conduit::logging::init_logger("conduit_tests", log_config);
    }

    ~GlobalSetup() {
        // Cleanup logging system
        conduit::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}

// Headlamp Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        // Initialize logging system for tests
        headlamp::logging::init_logging_system();

        // Keep console output quiet; warnings are still exercised
        headlamp::logging::LogConfig log_config;
        log_config.output = "/tmp/headlamp_tests";
        log_config.level = "debug";
        headlamp::logging::init_logger(log_config);
    }

    ~GlobalSetup() {
        // Cleanup logging system
        headlamp::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Process logger is initialized", "[smoke][logging]") {
    REQUIRE(headlamp::logging::get_current_logger() != nullptr);
}

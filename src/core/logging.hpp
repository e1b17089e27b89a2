#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace headlamp::logging {

/// Process logging settings
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // text or json (file output only)
    std::string output;           // Empty = console, otherwise log directory

    struct RotationConfig {
        size_t max_size_mb = 100;
        size_t max_files = 10;
    } rotation;
};

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process logger with the given settings
// Falls back to the console sink if the log directory cannot be created
quill::Logger* init_logger(const LogConfig& config);

// Change the level of the process logger ("debug", "info", "warning"/"warn", "error")
// Unknown names select info. No-op before init_logger().
void set_log_level(std::string_view level);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Process logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

}  // namespace headlamp::logging

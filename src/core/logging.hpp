#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace conduit::control {
struct LogConfig;
}

namespace conduit::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create a logger from config ("console" output, or a rotating text/json file
// under the configured directory) and make it the calling thread's logger
quill::Logger* init_logger(std::string_view name, const conduit::control::LogConfig& config);

// Stop the backend, flushing queued records (called at exit)
void shutdown_logging();

// Logger installed by init_logger on this thread (nullptr if none)
quill::Logger* get_current_logger();

// UUID v4 based correlation id: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation id format produced by generate_correlation_id
bool is_valid_uuid(std::string_view uuid);

// Null-safe wrappers: components take an optional logger and stay silent without one
#define CONDUIT_LOG_DEBUG(logger, fmt, ...)                 \
    do {                                                    \
        if (quill::Logger* conduit_log_ = (logger)) {       \
            LOG_DEBUG(conduit_log_, fmt, ##__VA_ARGS__);    \
        }                                                   \
    } while (0)

#define CONDUIT_LOG_INFO(logger, fmt, ...)                  \
    do {                                                    \
        if (quill::Logger* conduit_log_ = (logger)) {       \
            LOG_INFO(conduit_log_, fmt, ##__VA_ARGS__);     \
        }                                                   \
    } while (0)

#define CONDUIT_LOG_WARNING(logger, fmt, ...)               \
    do {                                                    \
        if (quill::Logger* conduit_log_ = (logger)) {       \
            LOG_WARNING(conduit_log_, fmt, ##__VA_ARGS__);  \
        }                                                   \
    } while (0)

#define CONDUIT_LOG_ERROR(logger, fmt, ...)                 \
    do {                                                    \
        if (quill::Logger* conduit_log_ = (logger)) {       \
            LOG_ERROR(conduit_log_, fmt, ##__VA_ARGS__);    \
        }                                                   \
    } while (0)

// Chain build logging
#define LOG_CHAIN_BUILT(logger, chain_type, unit_count, unit_names, build_us)            \
    CONDUIT_LOG_INFO(logger,                                                             \
                     "Chain built: chain_type={}, unit_count={}, units=[{}], "           \
                     "build_us={}",                                                      \
                     chain_type, unit_count, unit_names, build_us)

// Validation failure logging with context
#define LOG_VALIDATION_FAILED(logger, scope, error_code, error_detail)                   \
    CONDUIT_LOG_ERROR(logger, "Validation failed: scope={}, error_code={}, error_detail={}", \
                      scope, error_code, error_detail)

}  // namespace conduit::logging

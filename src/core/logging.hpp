#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string_view>

// Forward declaration to avoid circular dependency
namespace tally::control {
struct LogConfig;
}

namespace tally::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create (or fetch) the process logger from config.
// output "stdout" logs to the console, anything else is a directory receiving tally.log
quill::Logger* init_logger(const tally::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Process logger (nullptr until init_logger ran).
// Event paths run on arbitrary runtime threads, so the pointer is process-wide, not per thread
quill::Logger* get_logger() noexcept;

// Map a config level string to a quill level (unknown strings fall back to Info)
quill::LogLevel parse_log_level(std::string_view level) noexcept;

// Listener failure with its category and event
#define LOG_LISTENER_FAILURE(logger, category, event, detail)                             \
    LOG_WARNING(logger, "Listener failed: category={}, event={}, error={}", category, event, \
                detail)

}  // namespace tally::logging

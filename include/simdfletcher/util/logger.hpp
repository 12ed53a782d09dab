/*
    SimdFletcher Logging

    Based on Quill - a low-latency asynchronous logging library.
    Only the dispatcher logs; checksum kernels stay silent.

    - Background thread for I/O
    - fmt-style formatting
    - Macros are null-safe: messages before init() are dropped
*/

#pragma once

#ifdef SFL_HAS_LOGGING

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>

#include <memory>
#include <vector>

namespace sfl::logging {

// Log levels matching Quill
enum class Level {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

// Logger configuration (console only; kernels never log)
struct LogConfig {
    bool console_output = true;
    Level min_level = Level::Info;
};

// Initialize logging subsystem
inline void init(const LogConfig& config = {}) {
    quill::BackendOptions backend_options;
    backend_options.thread_name = "sfl_logger";
    quill::Backend::start(backend_options);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.console_output) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("sfl_console"));
    }

    quill::Logger* logger = quill::Frontend::create_or_get_logger("sfl", std::move(sinks));

    switch (config.min_level) {
        case Level::Trace:    logger->set_log_level(quill::LogLevel::TraceL1); break;
        case Level::Debug:    logger->set_log_level(quill::LogLevel::Debug); break;
        case Level::Info:     logger->set_log_level(quill::LogLevel::Info); break;
        case Level::Warning:  logger->set_log_level(quill::LogLevel::Warning); break;
        case Level::Error:    logger->set_log_level(quill::LogLevel::Error); break;
        case Level::Critical: logger->set_log_level(quill::LogLevel::Critical); break;
    }
}

// Get the library logger, nullptr until init() has run
inline quill::Logger* get() {
    return quill::Frontend::get_logger("sfl");
}

// Shutdown logging (call before exit)
inline void shutdown() {
    quill::Backend::stop();
}

// Flush all pending log messages
inline void flush() {
    if (auto* logger = get()) {
        logger->flush_log();
    }
}

} // namespace sfl::logging

// ============================================================================
// Convenience Macros
// ============================================================================

#define SFL_LOG_WITH_(macro, fmt, ...) \
    do { \
        if (quill::Logger* sfl_logger_ = ::sfl::logging::get()) { \
            macro(sfl_logger_, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define SFL_LOG_TRACE(fmt, ...)    SFL_LOG_WITH_(LOG_TRACE_L1, fmt, ##__VA_ARGS__)
#define SFL_LOG_DEBUG(fmt, ...)    SFL_LOG_WITH_(LOG_DEBUG, fmt, ##__VA_ARGS__)
#define SFL_LOG_INFO(fmt, ...)     SFL_LOG_WITH_(LOG_INFO, fmt, ##__VA_ARGS__)
#define SFL_LOG_WARN(fmt, ...)     SFL_LOG_WITH_(LOG_WARNING, fmt, ##__VA_ARGS__)
#define SFL_LOG_ERROR(fmt, ...)    SFL_LOG_WITH_(LOG_ERROR, fmt, ##__VA_ARGS__)
#define SFL_LOG_CRITICAL(fmt, ...) SFL_LOG_WITH_(LOG_CRITICAL, fmt, ##__VA_ARGS__)

#else // SFL_HAS_LOGGING not defined

// ============================================================================
// No-op stubs when logging is disabled
// ============================================================================

namespace sfl::logging {

enum class Level { Trace, Debug, Info, Warning, Error, Critical };

struct LogConfig {
    bool console_output = true;
    Level min_level = Level::Info;
};

inline void init(const LogConfig& = {}) {}
inline void* get() { return nullptr; }
inline void shutdown() {}
inline void flush() {}

} // namespace sfl::logging

#define SFL_LOG_TRACE(fmt, ...)    ((void)0)
#define SFL_LOG_DEBUG(fmt, ...)    ((void)0)
#define SFL_LOG_INFO(fmt, ...)     ((void)0)
#define SFL_LOG_WARN(fmt, ...)     ((void)0)
#define SFL_LOG_ERROR(fmt, ...)    ((void)0)
#define SFL_LOG_CRITICAL(fmt, ...) ((void)0)

#endif // SFL_HAS_LOGGING

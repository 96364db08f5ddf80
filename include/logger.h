#pragma once

#include "common.h"
#include <string>
#include <memory>

namespace voxlink {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide, thread-safe logging
 *
 * Console output (WARN and ERROR to stderr) plus an optional append-only file.
 * Safe to call from the audio callback thread and the session thread; callers
 * on the audio thread use LOG_AUDIO, which checks is_enabled() before the
 * message is built.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /// Replace level and file sink once the config is known
    static void configure(LogLevel min_level, const std::string& output_file);

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /// Session-log mirror: Error maps to ERROR, Success is marked, the rest is INFO
    static void event(Severity severity, const std::string& message);

    static bool is_enabled(LogLevel level);

    /**
     * @brief Parse "debug" | "info" | "warn" | "error" (case-insensitive); INFO otherwise
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Component-specific logging macros
#define LOG_AUDIO(msg) \
    do { \
        if (voxlink::Logger::is_enabled(voxlink::LogLevel::DEBUG)) \
            voxlink::Logger::debug(std::string("[Audio] ") + (msg)); \
    } while (0)
#define LOG_LIVE(msg) voxlink::Logger::info(std::string("[Live] ") + (msg))
#define LOG_MEMORY(msg) voxlink::Logger::info(std::string("[MemoryDB] ") + (msg))
#define LOG_CONTEXT(msg) voxlink::Logger::info(std::string("[Context] ") + (msg))
#define LOG_SESSION(msg) voxlink::Logger::info(std::string("[Session] ") + (msg))

} // namespace voxlink

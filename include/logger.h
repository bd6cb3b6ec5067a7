#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace orbion {

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
 * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names map to INFO
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides structured logging with levels and optional file output.
 * Thread-safe for concurrent use from the capture, network and playback threads.
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

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Component-specific logging macros
#define LOG_AUDIO(msg) orbion::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_PLAYBACK(msg) orbion::Logger::debug(std::string("[Playback] ") + (msg))
#define LOG_SESSION(msg) orbion::Logger::info(std::string("[Session] ") + (msg))
#define LOG_NET(msg) orbion::Logger::info(std::string("[Net] ") + (msg))
#define LOG_TOOL(msg) orbion::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_CHECKPOINT(msg) orbion::Logger::info(std::string("[Checkpoint] ") + (msg))
#define LOG_TRANSCRIPT(msg) orbion::Logger::debug(std::string("[Transcript] ") + (msg))

} // namespace orbion

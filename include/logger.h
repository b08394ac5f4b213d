#pragma once

#include <string>
#include <memory>

namespace parley {

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
 * @brief Process-wide, thread-safe logger
 *
 * Writes to the console and, when configured, appends to a file.
 * Safe to call before initialize(); messages then go straight to the console.
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

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

    /**
     * @brief Map a config string ("debug", "info", "warn", "error") to a level.
     * Unknown strings map to INFO.
     */
    static LogLevel parse_level(const std::string& text);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) parley::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg))
#define LOG_INFO(msg) parley::Logger::info(msg)
#define LOG_WARN(msg) parley::Logger::warn(msg)
#define LOG_ERROR(msg) parley::Logger::error(msg)

// Component-specific logging macros
#define LOG_CACHE(msg) parley::Logger::debug(std::string("[Cache] ") + (msg))
#define LOG_MEMORY(msg) parley::Logger::info(std::string("[Memory] ") + (msg))
#define LOG_CONTEXT(msg) parley::Logger::debug(std::string("[Context] ") + (msg))
#define LOG_TOOLS(msg) parley::Logger::info(std::string("[Tools] ") + (msg))
#define LOG_COORD(msg) parley::Logger::info(std::string("[Coordinator] ") + (msg))
#define LOG_LLM(msg) parley::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TURN(turn_id, state, data) parley::Logger::info(std::string("[turn] id=") + std::to_string(turn_id) + " state=" + (state) + " " + (data))

} // namespace parley

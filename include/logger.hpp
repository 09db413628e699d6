/**
 * @file logger.hpp
 * @brief Process-wide leveled logging for tproxy-compose
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * Log lines have the form
 *   [2024-01-01 12:00:00.000] [INFO ] Component: message
 * Errors and warnings go to stderr, everything else to stdout.
 */

#pragma once

#include <string>

namespace tproxy {

/**
 * @enum LogLevel
 * @brief Logging levels
 *
 * Higher levels include all lower level messages:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: All messages including detailed execution information
 */
enum class LogLevel {
    None,    ///< No logging
    Error,   ///< Error messages only
    Warning, ///< Error and warning messages
    Info,    ///< Informational messages and above
    Debug    ///< All messages including debug information
};

/**
 * @class Logger
 * @brief Static logging facade shared by all components
 *
 * Safe to use from several threads; lines are never interleaved.
 */
class Logger {
public:
    /**
     * @brief Set the global logging level
     * @param level Logging level to set
     *
     * The change itself is logged at Info level.
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Get current logging level
     */
    static LogLevel getLevel();

    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param component Name of the component emitting the message
     * @param message Message content to log
     */
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void error(const std::string& component, const std::string& message) {
        log(LogLevel::Error, component, message);
    }
    static void warning(const std::string& component, const std::string& message) {
        log(LogLevel::Warning, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        log(LogLevel::Info, component, message);
    }
    static void debug(const std::string& component, const std::string& message) {
        log(LogLevel::Debug, component, message);
    }

    /**
     * @brief Convert LogLevel enum to string representation
     */
    static std::string levelToString(LogLevel level);
};

} // namespace tproxy

/**
 * @file logger.hpp
 * @brief Leveled logging for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * Timestamped, leveled log output shared by the command executor, the rule
 * manager and the command line front end.
 */

#pragma once

#include <string>

namespace ufwctl {

/**
 * @enum LogLevel
 * @brief Logging levels
 *
 * Controls the verbosity of log output:
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
 * @brief Process-wide logger with a single global level
 *
 * Messages are written as "[timestamp] [LEVEL] Component: message".
 * Errors and warnings go to stderr, everything else to stdout.
 */
class Logger {
public:
    /**
     * @brief Set the global logging level
     * @param level New logging level
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Get the global logging level
     * @return Current logging level
     */
    static LogLevel getLevel();

    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param component Name of the emitting component
     * @param message Message content
     */
    static void log(LogLevel level, const std::string& component, const std::string& message);

    /**
     * @brief Convert LogLevel to its lowercase name
     * @param level Level to convert
     * @return "none", "error", "warning", "info" or "debug"
     */
    static std::string levelToString(LogLevel level);

    /**
     * @brief Parse a lowercase level name
     * @param name Level name
     * @return Matching LogLevel
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel levelFromString(const std::string& name);

private:
    static LogLevel current_level_; ///< Current global logging level
};

} // namespace ufwctl

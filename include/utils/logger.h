#pragma once
/**
 * @file logger.h
 * @brief Logging utilities
 */

#include <string>

namespace hud_advisor {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Set minimum log level
 */
void setLogLevel(LogLevel level);

/**
 * @brief Current minimum log level
 */
LogLevel logLevel();

/**
 * @brief Parse "debug" / "info" / "warning" / "error" (case-insensitive)
 * @return false if name is not a level; level is left untouched
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * @brief Log a message
 *
 * Safe to call from several threads; lines are never interleaved.
 */
void log(LogLevel level, const std::string& message);

/**
 * @brief Convenience logging functions
 */
void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

} // namespace hud_advisor

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>


///////////////////////////
///       LOGGING       ///
///////////////////////////
/**
 * @brief Severity of a log line.
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, OFF = 4 };

/**
 * @brief Set the minimum severity written to the log (INFO by default).
 */
void setLogLevel(LogLevel level);

/**
 * @brief Current minimum severity.
 */
LogLevel logLevel();

/**
 * @brief Write one line to std::clog as "[HH:MM:SS.mmm] [LEVEL] message".
 *
 * Safe to call from worker threads; lines never interleave.
 */
void logMessage(LogLevel level, const std::string& message);

inline void logDebug(const std::string& message) { logMessage(LogLevel::DEBUG, message); }
inline void logInfo(const std::string& message) { logMessage(LogLevel::INFO, message); }
inline void logWarning(const std::string& message) { logMessage(LogLevel::WARNING, message); }
inline void logError(const std::string& message) { logMessage(LogLevel::ERROR, message); }

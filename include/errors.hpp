#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Base class of every error raised by the timetabling core.
 */
class TimetableError : public std::runtime_error {
public:
    explicit TimetableError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Snapshot or assignment data that violates the model invariants.
 */
class ValidationError : public TimetableError {
public:
    explicit ValidationError(const std::string& message) : TimetableError("Validation error: " + message) {}
};

/**
 * @brief Pipeline parameter outside its accepted range.
 */
class ConfigError : public TimetableError {
public:
    explicit ConfigError(const std::string& message) : TimetableError("Config error: " + message) {}
};

/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exceptions are reserved for caller programming errors. Untrusted ID input
 * never throws; it is reported through ValidationOutcome or std::optional.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all ZAID library exceptions
 */
class ZaidException : public std::runtime_error {
public:
    explicit ZaidException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Operation called with arguments outside its contract
 */
class ValidationException : public ZaidException {
public:
    explicit ValidationException(const std::string& message)
        : ZaidException("Validation error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public ZaidException {
public:
    explicit ConfigException(const std::string& message)
        : ZaidException("Configuration error: " + message) {}
};

/**
 * @brief Parsing error (batch JSON documents)
 */
class ParsingException : public ZaidException {
public:
    explicit ParsingException(const std::string& message)
        : ZaidException("Parsing error: " + message) {}
};

} // namespace common

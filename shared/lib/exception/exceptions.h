/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Contract violations only. Malformed PESEL input is reported through
 * PeselResult, not through these types.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pesel::common {

/**
 * @brief Base exception for all PESEL library exceptions
 */
class PeselException : public std::runtime_error {
public:
    explicit PeselException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A failed parse was unwrapped as if it had succeeded
 */
class ParsingException : public PeselException {
public:
    explicit ParsingException(const std::string& message)
        : PeselException("Parsing error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public PeselException {
public:
    explicit ConfigException(const std::string& message)
        : PeselException("Configuration error: " + message) {}
};

/**
 * @brief Random byte source failed (OpenSSL RAND_bytes)
 */
class RandomSourceException : public PeselException {
public:
    explicit RandomSourceException(const std::string& message)
        : PeselException("Random source error: " + message) {}
};

} // namespace pesel::common

#pragma once

#include <LookForge/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for LookForge
 *
 * Every failure kind has its own class so callers can tell a bad
 * configuration from a malformed file or a missing input.
 */

#include <stdexcept>
#include <string>

namespace Look::Forge {

/**
 * @brief Base exception class for LookForge
 */
class LOOKFORGE_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class LOOKFORGE_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Invalid configuration (e.g., unknown transfer method name)
 */
class LOOKFORGE_API ConfigurationException : public Exception {
public:
    explicit ConfigurationException(const std::string& message)
        : Exception("Configuration error: " + message) {}
};

/**
 * @brief File I/O exception
 */
class LOOKFORGE_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Malformed LUT, Hald image or other structured input
 */
class LOOKFORGE_API FormatException : public Exception {
public:
    explicit FormatException(const std::string& message)
        : Exception("Format error: " + message) {}
};

/**
 * @brief Unsupported operation or format
 */
class LOOKFORGE_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

} // namespace Look::Forge

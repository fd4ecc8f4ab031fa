/**
 * @file errors.hpp
 * @brief Exception types raised by the Harbor listener subsystem
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every error is recoverable by the caller; none is process-fatal.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace harbor {

/**
 * @brief Invalid configuration supplied to a factory (missing key, bad value)
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Lookup failed in every repository that was searched
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Operation invoked with a protocol or option name that is not handled
 */
class UnhandledError : public std::runtime_error {
public:
    explicit UnhandledError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A transform stage failed; the whole Construct/Deconstruct call is aborted
 */
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Agent handshake failed or was out of sequence
 */
class AuthenticationError : public std::runtime_error {
public:
    explicit AuthenticationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Start/Stop/Restart of an infrastructure server failed
 */
class LifecycleError : public std::runtime_error {
public:
    explicit LifecycleError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace harbor

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised when a message exchanged with the simulation backend is malformed,
 *        arrives out of order or when the connection is lost.
 * @details The simulated clock cannot be rewound, so the run is over.
 */
class ProtocolError : public std::runtime_error
{
public:
    explicit ProtocolError(const std::string & what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when a host is asked for a power or allocation transition its current state forbids.
 */
class InvalidTransition : public std::logic_error
{
public:
    explicit InvalidTransition(const std::string & what) : std::logic_error(what) {}
};

/**
 * @brief Raised when a job is moved between states in an order its lifecycle forbids.
 */
class InvalidJobTransition : public std::logic_error
{
public:
    explicit InvalidJobTransition(const std::string & what) : std::logic_error(what) {}
};

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string & what) : std::runtime_error(what) {}
};

/**
 * @file errors.h
 * @brief Exception types raised by the simulation core
 */

#pragma once

#include <stdexcept>
#include <string>

namespace paddleball {

/**
 * @brief Raised when the game is wired with an impossible configuration
 *
 * Thrown for faults that must stop the session immediately, such as
 * commanding movement on an entity that was never given bounds.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace paddleball

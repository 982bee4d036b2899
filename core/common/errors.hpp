#pragma once

#include <stdexcept>
#include <string>

namespace gamemind {

/// Thrown when a configuration value is missing, mistyped or out of range.
/// Raised once at construction time; planning calls never throw it.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("config: " + what) {}
};

} // namespace gamemind

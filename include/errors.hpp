#pragma once

#include <stdexcept>
#include <string>

/// Raised for any invalid argument to a recseg entry point.
/// Thrown before any output is produced.
class ParameterError : public std::invalid_argument {
public:
    explicit ParameterError(std::string const& message)
        : std::invalid_argument(message) {}
};

#pragma once

#include <stdexcept>
#include <string>

// Invalid simulator setup: unknown method, bad mass, step size or time span
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Inertia tensor cannot be inverted
class SingularMatrixError : public std::runtime_error {
public:
    explicit SingularMatrixError(const std::string& msg) : std::runtime_error(msg) {}
};

// Adaptive solver failed to meet its error tolerance
class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& msg) : std::runtime_error(msg) {}
};

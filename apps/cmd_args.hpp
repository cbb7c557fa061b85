#pragma once

#include "errors.hpp"
#include "integrator.hpp"
#include "parse_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace cliarg {

inline bool isHelpFlag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

inline std::string requireOptionValue(int argc, char* argv[], int& i, const char* flag) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string("Missing value for ") + flag);
    }
    return std::string(argv[++i]);
}

// Validated here so a bad override fails before the config is read
inline std::string requireMethod(const std::string& raw, const char* flag) {
    try {
        return methodName(parseIntegrationMethod(raw));
    } catch (const ConfigError& e) {
        throw ConfigError(std::string(flag) + ": " + e.what());
    }
}

inline double parseOverride(const std::string& raw, const char* flag) {
    try {
        return parseutil::parseDoubleStrict(raw, flag);
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
}

// Overrides are passed on as their original text; these only check it
inline void validateNumber(const std::string& raw, const char* flag) {
    (void)parseOverride(raw, flag);
}

inline void validatePositive(const std::string& raw, const char* flag) {
    const double value = parseOverride(raw, flag);
    if (!std::isfinite(value) || value <= 0.0) {
        throw ConfigError(std::string(flag) + " must be > 0 (got '" + raw + "')");
    }
}

}  // namespace cliarg

#pragma once
#include <stdexcept>
#include <string>

namespace evalbox {

// Malformed or missing task descriptor / configuration. Fatal at construction.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The sandbox could not be started, reached, or torn down after the retry budget.
class InfraError : public std::runtime_error {
public:
    explicit InfraError(const std::string& what) : std::runtime_error(what) {}
};

}

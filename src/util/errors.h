// COBIN - Error types
// Fatal input/configuration errors and cooperative cancellation

#pragma once

#include <stdexcept>
#include <string>

namespace cobin {

// Malformed contig, fragment or score data. Fatal to the whole run.
class InputError : public std::invalid_argument {
public:
    explicit InputError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Parameter out of its valid range. Raised before any work starts.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Pipeline cancelled by the caller between (or during) stages.
class Cancelled : public std::runtime_error {
public:
    explicit Cancelled(const std::string& stage)
        : std::runtime_error("Cancelled during " + stage) {}
};

}  // namespace cobin

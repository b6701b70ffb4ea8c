#pragma once

#include <stdexcept>
#include <string>

namespace cadence::core {

// Raised at setup time when a system or script is registered without any
// capability the scheduler can dispatch. Not meant to be recovered from.
class ConfigurationError : public std::logic_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace cadence::core

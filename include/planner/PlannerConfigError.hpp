#pragma once

#include <stdexcept>
#include <string>

namespace Songbook {

/**
 * Thrown by a plan call when its configuration is invalid.
 * The Song passed to the call is left untouched.
 */
class PlannerConfigError : public std::runtime_error {
public:
    explicit PlannerConfigError(const std::string& message)
        : std::runtime_error(message) {
    }
};

} // namespace Songbook

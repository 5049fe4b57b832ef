#include "MixerErrors.hpp"

#include <sstream>

namespace {

std::string describe(const std::string& axis, float value,
                     const std::string& requirement) {
    std::ostringstream oss;
    oss << "Invalid input on axis '" << axis << "': " << value
        << " (expected " << requirement << ")";
    return oss.str();
}

} // namespace

InvalidInputError::InvalidInputError(const std::string& axis, float value,
                                     const std::string& requirement)
    : std::invalid_argument(describe(axis, value, requirement)),
      axis_(axis), value_(value) {}

NoDataError::NoDataError(const std::string& what)
    : std::runtime_error(what) {}

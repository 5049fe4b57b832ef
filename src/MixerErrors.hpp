#pragma once

#include <stdexcept>
#include <string>

// Raised when a command axis (or a geometry value) is outside its allowed range.
class InvalidInputError : public std::invalid_argument {
public:
    InvalidInputError(const std::string& axis, float value,
                      const std::string& requirement = "value in [0, 1]");

    const std::string& axis() const { return axis_; }
    float value() const { return value_; }

private:
    std::string axis_;
    float value_;
};

// Raised when a sensor sample is requested before enough samples were appended.
class NoDataError : public std::runtime_error {
public:
    explicit NoDataError(const std::string& what);
};

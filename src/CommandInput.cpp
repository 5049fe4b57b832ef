#include "CommandInput.hpp"
#include "MixerErrors.hpp"

namespace {

float validateAxis(const char* axis, float v) {
    // written so that NaN fails as well
    if (!(v >= 0.0f && v <= 1.0f)) {
        throw InvalidInputError(axis, v);
    }
    return v;
}

} // namespace

CommandInput::CommandInput(float throttle, float yaw_rate, float pitch, float roll)
    : throttle_(validateAxis("throttle", throttle)),
      yaw_rate_(validateAxis("yaw_rate", yaw_rate)),
      pitch_(validateAxis("pitch", pitch)),
      roll_(validateAxis("roll", roll)) {}

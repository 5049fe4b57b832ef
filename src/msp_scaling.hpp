// msp_scaling.hpp - unit conversions between MSP wire values and mixer units
#pragma once

#include <cmath>
#include <cstdint>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

struct EscRange {
    double min_pwm = 1000.0; // motor stopped
    double max_pwm = 2000.0;
};

// RC pulse width (us) -> stick position. Not clamped: a pulse outside
// [min_us, max_us] gives a value outside [0, 1] and is rejected by CommandInput.
inline float normalizeRcChannel(uint16_t pulse_us, double min_us = 1000.0, double max_us = 2000.0) {
    return static_cast<float>((static_cast<double>(pulse_us) - min_us) / (max_us - min_us));
}

// Motor speed in [0, 1] -> ESC command. Monotonic in speed.
inline uint16_t speedToEsc(float speed, const EscRange& range) {
    double v = range.min_pwm + static_cast<double>(speed) * (range.max_pwm - range.min_pwm);
    if (!(v > range.min_pwm)) v = range.min_pwm;
    if (v > range.max_pwm) v = range.max_pwm;
    return static_cast<uint16_t>(std::lround(v));
}

// Raw gyro LSB -> rad/s (2000 dps full scale)
inline float gyroLsbToRadPerSec(double lsb) {
    constexpr double DEG2RAD = M_PI / 180.0;
    constexpr double GYRO_LSB_PER_DPS = 16.4;
    return static_cast<float>(lsb / GYRO_LSB_PER_DPS * DEG2RAD);
}

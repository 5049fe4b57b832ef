#include "MotorSpeeds.hpp"
#include "MixerErrors.hpp"

#include <string>

namespace {

const char* const MOTOR_NAMES[MotorSpeeds::MOTOR_COUNT] = {
    "front_left", "front_right", "rear_left", "rear_right"
};

Motor makeMotor(const AirframeGeometry& geometry, std::size_t i) {
    const Eigen::Vector3f& p = geometry.arm_position[i];
    if (!(p.norm() > 0.0f)) {
        throw InvalidInputError(std::string(MOTOR_NAMES[i]) + ".arm_position",
                                p.norm(), "non-zero arm vector");
    }
    const float sign = geometry.yaw_sign[i];
    if (sign != 1.0f && sign != -1.0f) {
        throw InvalidInputError(std::string(MOTOR_NAMES[i]) + ".yaw_sign",
                                sign, "+1 or -1");
    }
    return Motor(p, sign);
}

} // namespace

float clampUnit(float v) {
    if (!(v > 0.0f)) return 0.0f;
    if (v > 1.0f) return 1.0f;
    return v;
}

MotorSpeeds::MotorSpeeds(const AirframeGeometry& geometry)
    : motors_{{makeMotor(geometry, 0), makeMotor(geometry, 1),
               makeMotor(geometry, 2), makeMotor(geometry, 3)}} {}

std::array<float, MotorSpeeds::MOTOR_COUNT> MotorSpeeds::toArray() const {
    return {motors_[0].speed(), motors_[1].speed(),
            motors_[2].speed(), motors_[3].speed()};
}

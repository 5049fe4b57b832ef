// MotorSpeeds.hpp - the four motors of an X-quad and their normalized speeds
#ifndef MOTOR_SPEEDS_HPP
#define MOTOR_SPEEDS_HPP

#include <array>
#include <cstddef>

#include <Eigen/Core>

#include "mixer_parameters.hpp"

enum class MotorId : std::size_t {
    FrontLeft = 0,
    FrontRight = 1,
    RearLeft = 2,
    RearRight = 3
};

// Saturate to [0, 1]. NaN saturates to 0.
float clampUnit(float v);

class Motor {
public:
    Motor(const Eigen::Vector3f& position, float yaw_sign)
        : position_(position), yaw_sign_(yaw_sign), speed_(0.0f) {}

    const Eigen::Vector3f& position() const { return position_; }
    float yawSign() const { return yaw_sign_; }

    float speed() const { return speed_; }
    void setSpeed(float v) { speed_ = clampUnit(v); }

private:
    Eigen::Vector3f position_;
    float yaw_sign_;
    float speed_;
};

class MotorSpeeds {
public:
    static constexpr std::size_t MOTOR_COUNT = 4;

    // Throws InvalidInputError for a zero arm vector or a yaw sign other than +/-1.
    explicit MotorSpeeds(const AirframeGeometry& geometry = AirframeGeometry{});

    void setFrontLeft(float v)  { motors_[0].setSpeed(v); }
    void setFrontRight(float v) { motors_[1].setSpeed(v); }
    void setRearLeft(float v)   { motors_[2].setSpeed(v); }
    void setRearRight(float v)  { motors_[3].setSpeed(v); }

    float getFrontLeft() const  { return motors_[0].speed(); }
    float getFrontRight() const { return motors_[1].speed(); }
    float getRearLeft() const   { return motors_[2].speed(); }
    float getRearRight() const  { return motors_[3].speed(); }

    const Motor& motor(MotorId id) const { return motors_[static_cast<std::size_t>(id)]; }
    void setSpeed(MotorId id, float v) { motors_[static_cast<std::size_t>(id)].setSpeed(v); }

    // FL, FR, RL, RR
    std::array<float, MOTOR_COUNT> toArray() const;

private:
    std::array<Motor, MOTOR_COUNT> motors_;
};

#endif // MOTOR_SPEEDS_HPP

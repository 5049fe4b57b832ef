#include "Controller.hpp"

Controller::Controller(const MixerParameters& params, const AirframeGeometry& geometry)
    : params_(params), motors_(geometry) {}

void Controller::ingest(const InertialSample& sample) {
    history_.append(sample);
}

const MotorSpeeds& Controller::mix(const CommandInput& commands) {
    // throws NoDataError before the first ingest()
    const InertialSample& sample = history_.latest();

    const Eigen::Vector3f desired = desiredRotation(commands, params_.max_tilt_rate);
    const Eigen::Vector3f error = torqueError(desired, sample.angularVelocity());
    last_torque_error_ = error;

    const float throttle_term = commands.throttle() * params_.throttle_gain;
    const float yaw_term = commands.yawRate() * params_.yaw_gain;

    for (std::size_t i = 0; i < MotorSpeeds::MOTOR_COUNT; ++i) {
        const MotorId id = static_cast<MotorId>(i);
        const Motor& m = motors_.motor(id);

        const float magnitude = perpendicularResidual(error, m.position()).norm();
        motors_.setSpeed(id, magnitude + throttle_term + m.yawSign() * yaw_term);
    }

    return motors_;
}

const MotorSpeeds& Controller::calculateMotorSpeeds(const InertialSample& sample,
                                                    const CommandInput& commands) {
    ingest(sample);
    return mix(commands);
}

Eigen::Vector3f Controller::desiredRotation(const CommandInput& commands, float max_tilt_rate) {
    return Eigen::Vector3f(max_tilt_rate * commands.roll(),
                           0.0f,
                           max_tilt_rate * commands.pitch());
}

Eigen::Vector3f Controller::torqueError(const Eigen::Vector3f& desired,
                                        const Eigen::Vector3f& angular_velocity) {
    Eigen::Vector3f error = desired - angular_velocity;
    error.y() = 0.0f;
    return error;
}

Eigen::Vector3f Controller::perpendicularResidual(const Eigen::Vector3f& torque_error,
                                                  const Eigen::Vector3f& arm) {
    const Eigen::Vector3f dir = arm.normalized();
    return torque_error - dir * dir.dot(torque_error);
}

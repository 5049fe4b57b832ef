// Controller.hpp - proportional X-quad mixer: gyro + commands -> four motor speeds
#ifndef CONTROLLER_HPP
#define CONTROLLER_HPP

#include <Eigen/Core>

#include "CommandInput.hpp"
#include "MotorSpeeds.hpp"
#include "SensorHistory.hpp"
#include "mixer_parameters.hpp"

class Controller {
public:
    explicit Controller(const MixerParameters& params = MixerParameters{},
                        const AirframeGeometry& geometry = AirframeGeometry{});

    void ingest(const InertialSample& sample);

    // Recompute all four motor speeds against the latest ingested sample.
    // Throws NoDataError if nothing has been ingested.
    const MotorSpeeds& mix(const CommandInput& commands);

    // ingest() followed by mix(); this is the per-tick entry point.
    const MotorSpeeds& calculateMotorSpeeds(const InertialSample& sample,
                                            const CommandInput& commands);

    const MotorSpeeds& motors() const { return motors_; }
    const SensorHistory& history() const { return history_; }
    const MixerParameters& parameters() const { return params_; }

    // Expose internals for logging/debug
    const Eigen::Vector3f& getLastTorqueError() const { return last_torque_error_; }

    // Commanded body rates about X (roll) and Z (pitch). Yaw is not part of it.
    static Eigen::Vector3f desiredRotation(const CommandInput& commands, float max_tilt_rate);

    // desired - gyro, with the Y (yaw) component removed.
    static Eigen::Vector3f torqueError(const Eigen::Vector3f& desired,
                                       const Eigen::Vector3f& angular_velocity);

    // Part of torque_error perpendicular to the arm direction. arm must be non-zero.
    static Eigen::Vector3f perpendicularResidual(const Eigen::Vector3f& torque_error,
                                                 const Eigen::Vector3f& arm);

private:
    MixerParameters params_;
    MotorSpeeds motors_;
    SensorHistory history_;

    Eigen::Vector3f last_torque_error_ = Eigen::Vector3f::Zero();
};

#endif // CONTROLLER_HPP

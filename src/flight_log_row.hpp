#pragma once

#include "AsyncCsvLogger.hpp"
#include "CommandInput.hpp"
#include "MotorSpeeds.hpp"
#include "SensorHistory.hpp"

inline LogRow makeLogRow(const InertialSample& sample, const CommandInput& commands,
                         const MotorSpeeds& speeds, bool commands_rejected) {
    LogRow row{};
    row.sample_time_s = sample.timestamp();
    row.gyro_x_rad_s = sample.angularVelocity().x();
    row.gyro_y_rad_s = sample.angularVelocity().y();
    row.gyro_z_rad_s = sample.angularVelocity().z();
    row.accel_x = sample.linearAcceleration().x();
    row.accel_y = sample.linearAcceleration().y();
    row.accel_z = sample.linearAcceleration().z();
    row.throttle = commands.throttle();
    row.yaw_rate = commands.yawRate();
    row.pitch = commands.pitch();
    row.roll = commands.roll();
    row.front_left = speeds.getFrontLeft();
    row.front_right = speeds.getFrontRight();
    row.rear_left = speeds.getRearLeft();
    row.rear_right = speeds.getRearRight();
    row.commands_rejected = commands_rejected;
    return row;
}

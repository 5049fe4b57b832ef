#include "ImuSensor.hpp"
#include "msp_scaling.hpp"

#include <iostream>

ImuSensor::ImuSensor(msp::client::Client& client, msp::FirmwareVariant fw_variant)
    : client_(client), raw_imu_msg_(fw_variant),
      start_(std::chrono::steady_clock::now()) {}

bool ImuSensor::update() {
    if (client_.sendMessage(raw_imu_msg_) != 1) {
        std::cerr << "[ImuSensor] Failed to read RawImu\n";
        return false;
    }

    const std::chrono::duration<float> t = std::chrono::steady_clock::now() - start_;

    const Eigen::Vector3f gyro(gyroLsbToRadPerSec(static_cast<double>(raw_imu_msg_.gyro[0])),
                               gyroLsbToRadPerSec(static_cast<double>(raw_imu_msg_.gyro[1])),
                               gyroLsbToRadPerSec(static_cast<double>(raw_imu_msg_.gyro[2])));
    // accelerometer stays in the sensor's native LSB
    const Eigen::Vector3f accel(static_cast<float>(raw_imu_msg_.acc[0]),
                                static_cast<float>(raw_imu_msg_.acc[1]),
                                static_cast<float>(raw_imu_msg_.acc[2]));

    sample_ = InertialSample(gyro, accel, t.count());
    return true;
}

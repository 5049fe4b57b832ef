#pragma once

#include <Client.hpp>
#include <msp_msg.hpp>

#include <chrono>

#include "SensorHistory.hpp"

class ImuSensor {
public:
    ImuSensor(msp::client::Client& client, msp::FirmwareVariant fw_variant);
    bool update();
    const InertialSample& getSample() const { return sample_; }

private:
    msp::client::Client& client_;
    msp::msg::RawImu raw_imu_msg_;
    std::chrono::steady_clock::time_point start_;
    InertialSample sample_;
};

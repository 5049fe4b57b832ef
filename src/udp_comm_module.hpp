#pragma once

#include <asio.hpp>
#include <array>
#include <string>

#include "MotorSpeeds.hpp"
#include "SensorHistory.hpp"

// Datagram in:  11 doubles [gx, gy, gz, ax, ay, az, t, throttle, yaw, pitch, roll]
// Datagram out:  4 doubles [front_left, front_right, rear_left, rear_right]
class UDPCommModule {
public:
    static constexpr size_t RX_DOUBLES = 11;
    static constexpr size_t TX_DOUBLES = 4;

    UDPCommModule(int local_port, const std::string& remote_host, int remote_port);

    // raw_commands is throttle, yaw, pitch, roll, not yet validated
    bool receive(InertialSample& out_sample, std::array<float, 4>& out_raw_commands);
    void send(const MotorSpeeds& speeds);

private:
    asio::io_context io_context_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint remote_endpoint_;
};

#include "udp_comm_module.hpp"
#include <asio.hpp>
#include <iostream>

using asio::ip::udp;

UDPCommModule::UDPCommModule(int local_port, const std::string& remote_host, int remote_port)
    : socket_(io_context_, udp::endpoint(udp::v4(), local_port)),
      remote_endpoint_(asio::ip::make_address(remote_host), remote_port)
{
    asio::socket_base::receive_buffer_size option(1024 * 64);
    socket_.set_option(option);
}

bool UDPCommModule::receive(InertialSample& out_sample, std::array<float, 4>& out_raw_commands) {
    std::array<double, RX_DOUBLES> buffer{};
    udp::endpoint sender_endpoint;
    asio::error_code ec;

    size_t len = socket_.receive_from(asio::buffer(buffer), sender_endpoint, 0, ec);
    if (ec) {
        std::cerr << "[UDPCommModule] receive failed: " << ec.message() << "\n";
        return false;
    }
    if (len != RX_DOUBLES * sizeof(double)) {
        std::cerr << "[UDPCommModule] dropped datagram of " << len << " bytes\n";
        return false;
    }

    out_sample = InertialSample(
        Eigen::Vector3f(static_cast<float>(buffer[0]), static_cast<float>(buffer[1]),
                        static_cast<float>(buffer[2])),
        Eigen::Vector3f(static_cast<float>(buffer[3]), static_cast<float>(buffer[4]),
                        static_cast<float>(buffer[5])),
        static_cast<float>(buffer[6]));
    for (size_t i = 0; i < 4; ++i) out_raw_commands[i] = static_cast<float>(buffer[7 + i]);
    return true;
}

void UDPCommModule::send(const MotorSpeeds& speeds) {
    const std::array<float, 4> s = speeds.toArray();
    const std::array<double, TX_DOUBLES> out = {s[0], s[1], s[2], s[3]};

    asio::error_code ec;
    socket_.send_to(asio::buffer(out), remote_endpoint_, 0, ec);
    if (ec) {
        std::cerr << "[UDPCommModule] send failed: " << ec.message() << "\n";
    }
}

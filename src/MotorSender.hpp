// MotorSender.hpp - component that converts motor speeds to ESC values and sends SetMotor
#ifndef MOTOR_SENDER_HPP
#define MOTOR_SENDER_HPP

#include <msp_msg.hpp>
#include <Client.hpp>
#include <array>

#include "MotorSpeeds.hpp"
#include "msp_scaling.hpp"

class MotorSender {
public:
    MotorSender(msp::client::Client& client, msp::FirmwareVariant fw_variant,
                EscRange range = EscRange{})
        : client_(client), fw_variant_(fw_variant), range_(range) {}

    // send FL, FR, RL, RR as motor1..4 (motor5..8 will be zeroed)
    int send(const MotorSpeeds& speeds) {
        const std::array<float, 4> s = speeds.toArray();
        std::array<uint16_t, 4> esc;
        for (size_t i = 0; i < 4; ++i) esc[i] = speedToEsc(s[i], range_);
        return sendRaw(esc);
    }

    // all motors to the ESC minimum
    int sendStop() {
        const uint16_t stop = speedToEsc(0.0f, range_);
        return sendRaw({stop, stop, stop, stop});
    }

    std::array<uint16_t,4> getLastMsg() const { return last_msg_; }
    int getLastResult() const { return last_result_; }

private:
    int sendRaw(const std::array<uint16_t,4>& motors) {
        msp::msg::SetMotor msg(fw_variant_);
        for (size_t i = 0; i < 4; ++i) msg.motor[i] = motors[i];
        for (size_t i = 4; i < 8; ++i) msg.motor[i] = 0;

        last_msg_ = motors;

        last_result_ = client_.sendMessage(msg);
        return last_result_;
    }

    msp::client::Client& client_;
    msp::FirmwareVariant fw_variant_;
    EscRange range_;
    std::array<uint16_t,4> last_msg_ = {0,0,0,0};
    int last_result_ = 0;
};

#endif // MOTOR_SENDER_HPP

#pragma once

#include <Client.hpp>
#include <msp_msg.hpp>

#include <array>
#include <cstdint>

#include "CommandInput.hpp"

// Reads MSP_RC and turns the AETR sticks into a CommandInput.
class RcInput {
public:
    RcInput(msp::client::Client& client, msp::FirmwareVariant fw_variant);

    bool update();

    // Throws InvalidInputError if a stick is outside its calibrated range.
    CommandInput commands() const;

    // Last raw pulse widths: roll, pitch, throttle, yaw
    const std::array<uint16_t, 4>& getRawChannels() const { return raw_; }

private:
    msp::client::Client& client_;
    msp::msg::Rc rc_msg_;
    std::array<uint16_t, 4> raw_ = {1500, 1500, 1000, 1500};
};

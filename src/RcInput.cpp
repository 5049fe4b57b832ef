#include "RcInput.hpp"
#include "msp_scaling.hpp"

#include <iostream>

RcInput::RcInput(msp::client::Client& client, msp::FirmwareVariant fw_variant)
    : client_(client), rc_msg_(fw_variant) {}

bool RcInput::update() {
    if (client_.sendMessage(rc_msg_) != 1) {
        std::cerr << "[RcInput] Failed to read Rc\n";
        return false;
    }
    if (rc_msg_.channels.size() < raw_.size()) {
        std::cerr << "[RcInput] Expected at least " << raw_.size()
                  << " channels, got " << rc_msg_.channels.size() << "\n";
        return false;
    }

    for (size_t i = 0; i < raw_.size(); ++i) raw_[i] = rc_msg_.channels[i];
    return true;
}

CommandInput RcInput::commands() const {
    // AETR: aileron=roll, elevator=pitch, throttle, rudder=yaw
    return CommandInput(normalizeRcChannel(raw_[2]),
                        normalizeRcChannel(raw_[3]),
                        normalizeRcChannel(raw_[1]),
                        normalizeRcChannel(raw_[0]));
}

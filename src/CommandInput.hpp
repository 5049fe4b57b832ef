#pragma once

// Validated transmitter command axes. Every axis lies in [0, 1] for the
// lifetime of the object; the constructor throws InvalidInputError otherwise.
class CommandInput {
public:
    CommandInput(float throttle, float yaw_rate, float pitch, float roll);

    float throttle() const { return throttle_; }
    float yawRate() const { return yaw_rate_; }
    float pitch() const { return pitch_; }
    float roll() const { return roll_; }

private:
    float throttle_;
    float yaw_rate_;
    float pitch_;
    float roll_;
};

#pragma once

#include <array>
#include <cmath>

#include <Eigen/Core>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

struct MixerParameters {
    float max_tilt_rate = static_cast<float>(M_PI / 6.0); // rad/s at full roll/pitch stick
    float throttle_gain = 0.5f;
    float yaw_gain = 0.25f;
};

// Body-frame arm offsets and yaw signs, ordered FL, FR, RL, RR.
// yaw_sign is +1 for the diagonal pair that speeds up on positive yaw command.
struct AirframeGeometry {
    std::array<Eigen::Vector3f, 4> arm_position = {
        Eigen::Vector3f( 1.0f, 0.0f, -1.0f),
        Eigen::Vector3f( 1.0f, 0.0f,  1.0f),
        Eigen::Vector3f(-1.0f, 0.0f, -1.0f),
        Eigen::Vector3f(-1.0f, 0.0f,  1.0f)
    };
    std::array<float, 4> yaw_sign = {1.0f, -1.0f, -1.0f, 1.0f};
};

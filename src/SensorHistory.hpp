#pragma once

#include <array>
#include <cstddef>

#include <Eigen/Core>

// One IMU reading in the body frame. Gyro in rad/s, accelerometer in the
// sensor's native units, timestamp in seconds.
class InertialSample {
public:
    InertialSample()
        : angular_velocity_(Eigen::Vector3f::Zero()),
          linear_acceleration_(Eigen::Vector3f::Zero()),
          timestamp_(0.0f) {}

    InertialSample(const Eigen::Vector3f& angular_velocity,
                   const Eigen::Vector3f& linear_acceleration,
                   float timestamp)
        : angular_velocity_(angular_velocity),
          linear_acceleration_(linear_acceleration),
          timestamp_(timestamp) {}

    const Eigen::Vector3f& angularVelocity() const { return angular_velocity_; }
    const Eigen::Vector3f& linearAcceleration() const { return linear_acceleration_; }
    float timestamp() const { return timestamp_; }

private:
    Eigen::Vector3f angular_velocity_;
    Eigen::Vector3f linear_acceleration_;
    float timestamp_;
};

// Fixed-capacity ring of the most recent samples. Once full, each append
// overwrites the oldest entry.
class SensorHistory {
public:
    static constexpr std::size_t CAPACITY = 10;

    void append(const InertialSample& sample);

    // Throws NoDataError when nothing has been appended yet.
    const InertialSample& latest() const;
    bool tryLatest(InertialSample& out) const;

    // k = 0 is the latest sample. Throws NoDataError if fewer than k+1 are held.
    const InertialSample& sampleAgo(std::size_t k) const;

    std::size_t size() const { return count_; }
    std::size_t capacity() const { return CAPACITY; }
    bool empty() const { return count_ == 0; }

private:
    std::array<InertialSample, CAPACITY> samples_{};
    std::size_t newest_ = 0; // valid only when count_ > 0
    std::size_t count_ = 0;
};

#include <gtest/gtest.h>

#include <cmath>
#include <random>

#include "Controller.hpp"
#include "MixerErrors.hpp"

namespace {

InertialSample gyroSample(const Eigen::Vector3f& gyro, float t = 0.0f) {
    return InertialSample(gyro, Eigen::Vector3f(0.0f, 0.0f, 9.81f), t);
}

void expectAllSpeeds(const MotorSpeeds& s, float fl, float fr, float rl, float rr) {
    EXPECT_NEAR(s.getFrontLeft(), fl, 1e-6f);
    EXPECT_NEAR(s.getFrontRight(), fr, 1e-6f);
    EXPECT_NEAR(s.getRearLeft(), rl, 1e-6f);
    EXPECT_NEAR(s.getRearRight(), rr, 1e-6f);
}

} // namespace

TEST(ControllerTest, MixBeforeIngestThrowsNoData) {
    Controller controller;
    EXPECT_THROW(controller.mix(CommandInput(0.5f, 0.0f, 0.0f, 0.0f)), NoDataError);
    expectAllSpeeds(controller.motors(), 0.0f, 0.0f, 0.0f, 0.0f);
}

TEST(ControllerTest, ZeroInputGivesZeroSpeeds) {
    Controller controller;
    const MotorSpeeds& s = controller.calculateMotorSpeeds(
        gyroSample(Eigen::Vector3f::Zero()), CommandInput(0.0f, 0.0f, 0.0f, 0.0f));
    expectAllSpeeds(s, 0.0f, 0.0f, 0.0f, 0.0f);
}

TEST(ControllerTest, FullThrottleGivesHalfSpeed) {
    Controller controller;
    const MotorSpeeds& s = controller.calculateMotorSpeeds(
        gyroSample(Eigen::Vector3f::Zero()), CommandInput(1.0f, 0.0f, 0.0f, 0.0f));
    expectAllSpeeds(s, 0.5f, 0.5f, 0.5f, 0.5f);
}

TEST(ControllerTest, YawOnlyDrivesDiagonalPair) {
    Controller controller;
    const MotorSpeeds& s = controller.calculateMotorSpeeds(
        gyroSample(Eigen::Vector3f::Zero()), CommandInput(0.0f, 1.0f, 0.0f, 0.0f));
    expectAllSpeeds(s, 0.25f, 0.0f, 0.0f, 0.25f);
}

TEST(ControllerTest, ThrottleAndYawCombine) {
    Controller controller;
    const MotorSpeeds& s = controller.calculateMotorSpeeds(
        gyroSample(Eigen::Vector3f::Zero()), CommandInput(1.0f, 1.0f, 0.0f, 0.0f));
    expectAllSpeeds(s, 0.75f, 0.25f, 0.25f, 0.75f);
}

TEST(ControllerTest, YawRateFromGyroIsIgnored) {
    Controller a;
    Controller b;
    const CommandInput c(0.6f, 0.2f, 0.0f, 0.0f);
    const std::array<float, 4> still =
        a.calculateMotorSpeeds(gyroSample(Eigen::Vector3f::Zero()), c).toArray();
    const std::array<float, 4> spinning =
        b.calculateMotorSpeeds(gyroSample(Eigen::Vector3f(0.0f, 3.0f, 0.0f)), c).toArray();
    EXPECT_EQ(still, spinning);
    EXPECT_EQ(b.getLastTorqueError().y(), 0.0f);
}

TEST(ControllerTest, DesiredRotationScalesRollAndPitch) {
    const float max_rate = static_cast<float>(M_PI / 6.0);
    const Eigen::Vector3f d = Controller::desiredRotation(CommandInput(0.3f, 0.9f, 0.5f, 1.0f), max_rate);
    EXPECT_NEAR(d.x(), max_rate, 1e-6f);
    EXPECT_EQ(d.y(), 0.0f);
    EXPECT_NEAR(d.z(), 0.5f * max_rate, 1e-6f);
}

TEST(ControllerTest, TorqueErrorDropsYawComponent) {
    const Eigen::Vector3f e = Controller::torqueError(Eigen::Vector3f(1.0f, 0.0f, 2.0f),
                                                      Eigen::Vector3f(0.25f, 5.0f, -1.0f));
    EXPECT_TRUE(e.isApprox(Eigen::Vector3f(0.75f, 0.0f, 3.0f)));
}

TEST(ControllerTest, ResidualIsPerpendicularToEveryArm) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> dist(-5.0f, 5.0f);
    const MotorSpeeds geometry;

    for (int trial = 0; trial < 500; ++trial) {
        const Eigen::Vector3f error(dist(rng), 0.0f, dist(rng));
        if (error.norm() < 1e-3f) continue;

        for (size_t i = 0; i < MotorSpeeds::MOTOR_COUNT; ++i) {
            const Eigen::Vector3f& p = geometry.motor(static_cast<MotorId>(i)).position();
            const Eigen::Vector3f r = Controller::perpendicularResidual(error, p);
            EXPECT_NEAR(r.dot(p), 0.0f, 1e-4f * (1.0f + error.norm()));
        }
    }
}

TEST(ControllerTest, ResidualOfArmAlignedErrorVanishes) {
    const Eigen::Vector3f arm(1.0f, 0.0f, -1.0f);
    const Eigen::Vector3f r = Controller::perpendicularResidual(2.5f * arm, arm);
    EXPECT_NEAR(r.norm(), 0.0f, 1e-5f);
}

TEST(ControllerTest, OutputsAlwaysSaturated) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    std::uniform_real_distribution<float> gyro(-50.0f, 50.0f);
    Controller controller;

    for (int tick = 0; tick < 2000; ++tick) {
        const CommandInput c(unit(rng), unit(rng), unit(rng), unit(rng));
        const InertialSample sample(Eigen::Vector3f(gyro(rng), gyro(rng), gyro(rng)),
                                    Eigen::Vector3f(gyro(rng), gyro(rng), gyro(rng)),
                                    static_cast<float>(tick) * 0.002f);
        for (float v : controller.calculateMotorSpeeds(sample, c).toArray()) {
            EXPECT_GE(v, 0.0f);
            EXPECT_LE(v, 1.0f);
        }
    }
}

TEST(ControllerTest, MixIsDeterministic) {
    Controller controller;
    controller.ingest(gyroSample(Eigen::Vector3f(0.1f, -0.2f, 0.05f), 1.0f));
    const CommandInput c(0.4f, 0.3f, 0.7f, 0.2f);

    const std::array<float, 4> first = controller.mix(c).toArray();
    const std::array<float, 4> second = controller.mix(c).toArray();
    EXPECT_EQ(first, second);
    EXPECT_EQ(controller.history().size(), 1u);
}

TEST(ControllerTest, RollCommandRaisesMotorsByResidualMagnitude) {
    Controller controller;
    const float max_rate = controller.parameters().max_tilt_rate;
    const MotorSpeeds& s = controller.calculateMotorSpeeds(
        gyroSample(Eigen::Vector3f::Zero()), CommandInput(0.0f, 0.0f, 0.0f, 1.0f));

    // error = (max_rate, 0, 0); every arm is 45 degrees off X, residual = max_rate / sqrt(2)
    const float expected = max_rate / std::sqrt(2.0f);
    expectAllSpeeds(s, expected, expected, expected, expected);
}

TEST(ControllerTest, MixUsesMostRecentSample) {
    Controller controller;
    const CommandInput c(0.2f, 0.0f, 0.0f, 0.0f);
    controller.ingest(gyroSample(Eigen::Vector3f(2.0f, 0.0f, 0.0f), 0.0f));
    controller.ingest(gyroSample(Eigen::Vector3f::Zero(), 0.01f));

    expectAllSpeeds(controller.mix(c), 0.1f, 0.1f, 0.1f, 0.1f);
}

TEST(ControllerTest, CustomParametersApply) {
    MixerParameters params;
    params.throttle_gain = 0.8f;
    params.yaw_gain = 0.1f;
    Controller controller(params);

    const MotorSpeeds& s = controller.calculateMotorSpeeds(
        gyroSample(Eigen::Vector3f::Zero()), CommandInput(1.0f, 1.0f, 0.0f, 0.0f));
    expectAllSpeeds(s, 0.9f, 0.7f, 0.7f, 0.9f);
}

TEST(ControllerTest, InvalidGeometryRejectedAtConstruction) {
    AirframeGeometry geometry;
    geometry.arm_position[0] = Eigen::Vector3f::Zero();
    EXPECT_THROW(Controller controller(MixerParameters{}, geometry), InvalidInputError);
}

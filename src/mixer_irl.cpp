#include <Client.hpp>
#include <msp_msg.hpp>
#include "Controller.hpp"
#include "MixerErrors.hpp"
#include "ImuSensor.hpp"
#include "RcInput.hpp"
#include "MotorSender.hpp"
#include "AsyncCsvLogger.hpp"
#include "flight_log_row.hpp"

#include <iostream>
#include <thread>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <atomic>
#include <optional>

static void sendEmergencyStop(MotorSender& sender) {
    if (sender.sendStop() == 1)
        std::cerr << "Motors stopped\n";
    else
        std::cerr << "Failed to stop motors\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

std::atomic<bool> interrupted{false};

void signalHandler(int) {
    interrupted = true;
}

// ===========================
// main()
// ===========================
int main(int argc, char* argv[]) {

    std::signal(SIGINT, signalHandler);

    const std::string device =
        (argc > 1) ? std::string(argv[1]) : "/dev/ttyUSB0";
    const size_t baudrate = (argc > 2) ? std::stoul(argv[2]) : 115200;

    // Optional CLI: loop period and ESC range
    const double dt = (argc > 3) ? std::stod(argv[3]) : 0.002;          // s
    EscRange esc_range;
    if (argc > 4) esc_range.min_pwm = std::stod(argv[4]);
    if (argc > 5) esc_range.max_pwm = std::stod(argv[5]);

    msp::client::Client  client;
    client.setLoggingLevel(msp::client::LoggingLevel::WARNING);
    client.setVariant(msp::FirmwareVariant::BAFL);
    client.start(device, baudrate);

    msp::FirmwareVariant fw_variant = msp::FirmwareVariant::BAFL;

    MixerParameters params;
    Controller controller(params);
    ImuSensor imu(client, fw_variant);
    RcInput rc(client, fw_variant);
    MotorSender sender(client, fw_variant, esc_range);

    // Async CSV logger
    AsyncCsvLogger logger("logs", "log_mixer_irl_", 4096);

    std::optional<CommandInput> last_good;
    long long counter = 0;

    while (!interrupted) {
        if (!imu.update() || !rc.update()) continue;

        bool commands_rejected = false;
        try {
            const CommandInput commands = rc.commands();
            last_good = commands;
        } catch (const InvalidInputError& e) {
            commands_rejected = true;
            std::cerr << "[Main] " << e.what() << ", holding last commands\n";
        }

        const InertialSample& sample = imu.getSample();
        controller.ingest(sample);
        if (!last_good) {
            if (sender.sendStop() != 1) std::cerr << "[Main] Failed to hold motors stopped\n";
            continue;
        }

        const MotorSpeeds& speeds = controller.mix(*last_good);
        int send_res = sender.send(speeds);
        if (send_res != 1) {
            std::cerr << "[Main] SetMotor failed\n";
        }

        if ((counter++ % 100) == 0) {
            const std::array<uint16_t,4> esc = sender.getLastMsg();
            std::cout << "[Main] gyro=(" << sample.angularVelocity().x()
                << ", " << sample.angularVelocity().y()
                << ", " << sample.angularVelocity().z() << ") rad/s"
                << " m1=" << esc[0]
                << " m2=" << esc[1]
                << " m3=" << esc[2]
                << " m4=" << esc[3]
                << " send_res=" << send_res << '\n';
        }

        const LogRow row = makeLogRow(sample, *last_good, speeds, commands_rejected);

        logger.push(row);
        std::this_thread::sleep_for(std::chrono::duration<double>(dt));
    }

    std::cerr << "Control loop interrupted." << std::endl;

    sendEmergencyStop(sender);

    // ensure logger is stopped and flushed before exiting
    logger.stop();

    client.stop();

    std::cout << "PROGRAM COMPLETE\n";
    return 0;
}

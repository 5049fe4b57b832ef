#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iomanip>
#include <optional>

#include "udp_comm_module.hpp"
#include "Controller.hpp"
#include "MixerErrors.hpp"
#include "AsyncCsvLogger.hpp"
#include "flight_log_row.hpp"

std::atomic<bool> run_program{true};
void signalHandler(int) { run_program = false; }

/* HIL main program: simulator sends IMU + sticks over UDP, we answer with motor speeds */

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);

    const int local_port = (argc > 1) ? std::stoi(argv[1]) : 4002;
    const std::string remote_host = (argc > 2) ? std::string(argv[2]) : "127.0.0.1";
    const int remote_port = (argc > 3) ? std::stoi(argv[3]) : 4005;
    const std::string log_dir = (argc > 4) ? std::string(argv[4]) : "logs";

    UDPCommModule comm(local_port, remote_host, remote_port);

    MixerParameters params;
    Controller controller(params);

    AsyncCsvLogger logger(log_dir, "log_mixer_hil_", 4096);

    std::cout << "HIL mixer started\n";
    std::cout << std::fixed << std::setprecision(4);

    std::optional<CommandInput> last_good;
    long long counter = 0;
    long long rejected = 0;

    while (run_program) {
        InertialSample sample;
        std::array<float, 4> raw{};
        if (!comm.receive(sample, raw)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        bool commands_rejected = false;
        try {
            const CommandInput commands(raw[0], raw[1], raw[2], raw[3]);
            last_good = commands;
        } catch (const InvalidInputError& e) {
            commands_rejected = true;
            ++rejected;
            std::cerr << "[HIL] " << e.what() << ", holding last commands\n";
        }

        controller.ingest(sample);
        if (!last_good) {
            // nothing valid received yet, keep motors stopped
            comm.send(controller.motors());
            continue;
        }

        const MotorSpeeds& speeds = controller.mix(*last_good);
        comm.send(speeds);

        const LogRow row = makeLogRow(sample, *last_good, speeds, commands_rejected);
        logger.push(row);

        if ((counter++ % 50) == 0) {
            std::cout << "t=" << sample.timestamp()
                      << " | FL=" << speeds.getFrontLeft()
                      << " | FR=" << speeds.getFrontRight()
                      << " | RL=" << speeds.getRearLeft()
                      << " | RR=" << speeds.getRearRight()
                      << " | rejected=" << rejected
                      << "\r" << std::flush;
        }
    }

    logger.stop();
    std::cout << "\nHIL stopped.\n";
    return 0;
}

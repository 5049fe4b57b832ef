#pragma once
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <atomic>
#include <cstdint>

struct LogRow {
    double sample_time_s{};
    double gyro_x_rad_s{};
    double gyro_y_rad_s{};
    double gyro_z_rad_s{};
    double accel_x{};
    double accel_y{};
    double accel_z{};
    double throttle{};
    double yaw_rate{};
    double pitch{};
    double roll{};
    double front_left{};
    double front_right{};
    double rear_left{};
    double rear_right{};
    bool commands_rejected{};
};

class AsyncCsvLogger {
public:
    AsyncCsvLogger(std::string dir, std::string prefix, size_t max_queue = 4096);
    ~AsyncCsvLogger();

    void push(const LogRow& row);
    void stop();

    bool isOpen() const { return file_.is_open(); }
    std::string filename() const { return filename_; }
    uint64_t droppedRows() const { return dropped_rows_.load(std::memory_order_relaxed); }

    AsyncCsvLogger(const AsyncCsvLogger&) = delete;
    AsyncCsvLogger& operator=(const AsyncCsvLogger&) = delete;

private:
    void workerLoop();
    std::string makeFilename() const;
    static std::string currentUtcTimestamp();            // with microseconds
    static std::string currentUtcTimestampForFilename(); // YYYYMMDD_HHMMSS

    const std::string dir_;
    const std::string prefix_;
    const size_t max_queue_;

    std::ofstream file_;
    std::string filename_;

    std::deque<LogRow> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> dropped_rows_{0};

    // flush every N lines
    uint64_t lines_written_{0};
    static constexpr uint64_t FLUSH_EVERY = 200;
};

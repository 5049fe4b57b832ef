#include "AsyncCsvLogger.hpp"

#include <filesystem>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

using namespace std::chrono;

AsyncCsvLogger::AsyncCsvLogger(std::string dir, std::string prefix, size_t max_queue)
    : dir_(std::move(dir)), prefix_(std::move(prefix)), max_queue_(max_queue)
{
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        std::cerr << "[AsyncCsvLogger] Cannot create " << dir_ << ": " << ec.message() << "\n";
    }

    filename_ = makeFilename();
    file_.open(filename_, std::ios::out | std::ios::trunc);

    if (!file_.is_open()) {
        std::cerr << "[AsyncCsvLogger] Cannot open " << filename_ << ", logging disabled\n";
        running_ = false;
        return;
    }

    file_ << std::fixed << std::setprecision(6);
    file_ << "timestamp_utc;"
          << "sample_time_s;"
          << "gyro_x_rad_s;"
          << "gyro_y_rad_s;"
          << "gyro_z_rad_s;"
          << "accel_x;"
          << "accel_y;"
          << "accel_z;"
          << "throttle;"
          << "yaw_rate;"
          << "pitch;"
          << "roll;"
          << "front_left;"
          << "front_right;"
          << "rear_left;"
          << "rear_right;"
          << "commands_rejected\n";

    running_ = true;
    worker_ = std::thread(&AsyncCsvLogger::workerLoop, this);
}

AsyncCsvLogger::~AsyncCsvLogger() {
    stop();
}

void AsyncCsvLogger::push(const LogRow& row) {
    if (!running_.load(std::memory_order_relaxed) || !file_.is_open()) return;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (queue_.size() >= max_queue_) {
            queue_.pop_front(); // drop oldest
            dropped_rows_.fetch_add(1, std::memory_order_relaxed);
        }
        queue_.push_back(row);
    }
    cv_.notify_one();
}

void AsyncCsvLogger::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        running_.store(false);
    }

    cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

std::string AsyncCsvLogger::makeFilename() const {
    std::string fname = dir_;
    if (!fname.empty() && fname.back() != '/' && fname.back() != '\\') fname += '/';
    fname += prefix_;
    fname += currentUtcTimestampForFilename();
    fname += ".csv";
    return fname;
}

std::string AsyncCsvLogger::currentUtcTimestampForFilename() {
    auto now = system_clock::now();
    std::time_t now_c = system_clock::to_time_t(now);

    std::tm tm_utc;
#if defined(_WIN32)
    gmtime_s(&tm_utc, &now_c);
#else
    gmtime_r(&now_c, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string AsyncCsvLogger::currentUtcTimestamp() {
    auto now = system_clock::now();
    auto now_us = time_point_cast<microseconds>(now);
    auto us = now_us.time_since_epoch() % seconds(1);

    std::time_t now_c = system_clock::to_time_t(now);
    std::tm tm_utc;
#if defined(_WIN32)
    gmtime_s(&tm_utc, &now_c);
#else
    gmtime_r(&now_c, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%d_%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << us.count();
    return oss.str();
}

void AsyncCsvLogger::workerLoop() {
    // write in batches to keep the mutex held briefly
    while (true) {
        std::deque<LogRow> local;

        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [&] {
                return !running_.load(std::memory_order_relaxed) || !queue_.empty();
            });

            if (queue_.empty() && !running_.load(std::memory_order_relaxed)) break;
            local.swap(queue_);
        }

        for (const auto& row : local) {
            if (!file_.is_open()) break;

            file_ << currentUtcTimestamp() << ';'
                  << row.sample_time_s << ';'
                  << row.gyro_x_rad_s << ';'
                  << row.gyro_y_rad_s << ';'
                  << row.gyro_z_rad_s << ';'
                  << row.accel_x << ';'
                  << row.accel_y << ';'
                  << row.accel_z << ';'
                  << row.throttle << ';'
                  << row.yaw_rate << ';'
                  << row.pitch << ';'
                  << row.roll << ';'
                  << row.front_left << ';'
                  << row.front_right << ';'
                  << row.rear_left << ';'
                  << row.rear_right << ';'
                  << (row.commands_rejected ? 1 : 0) << '\n';

            if ((++lines_written_ % FLUSH_EVERY) == 0) {
                file_.flush();
            }
        }
    }

    if (file_.is_open()) file_.flush();
}

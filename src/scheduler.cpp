#include "rtufetch/scheduler.hpp"
#include "rtufetch/error.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rtufetch {

std::chrono::system_clock::time_point nextFireTime(std::chrono::system_clock::time_point now,
                                                   int hour, int minute) {
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw FetchError(ErrorCode::InvalidInput, fmt::format("Invalid schedule time {:02}:{:02}", hour, minute));
    }

    const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&now_t, &local);

    for (int day_offset = 0; day_offset < 3; ++day_offset) {
        std::tm candidate = local;
        candidate.tm_mday += day_offset;
        candidate.tm_hour = hour;
        candidate.tm_min = minute;
        candidate.tm_sec = 0;
        candidate.tm_isdst = -1;

        const std::time_t fire_t = std::mktime(&candidate);
        if (fire_t == static_cast<std::time_t>(-1)) {
            throw FetchError(ErrorCode::InvalidInput, "Schedule time cannot be represented");
        }
        const auto fire = std::chrono::system_clock::from_time_t(fire_t);
        if (fire > now) {
            return fire;
        }
    }

    // Unreachable for sane clocks; a DST gap can at most shift by one day.
    return now + std::chrono::hours(24);
}

DailyScheduler::DailyScheduler(int hour, int minute, Trigger trigger)
    : DailyScheduler(hour, minute, std::move(trigger), [] { return std::chrono::system_clock::now(); }) {}

DailyScheduler::DailyScheduler(int hour, int minute, Trigger trigger, Clock clock)
    : hour_(hour), minute_(minute), trigger_(std::move(trigger)), clock_(std::move(clock)) {
    // Validates hour and minute up front.
    (void)nextFireTime(std::chrono::system_clock::time_point{}, hour_, minute_);
}

DailyScheduler::~DailyScheduler() {
    stop();
}

void DailyScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        throw FetchError(ErrorCode::InvalidState, "Scheduler already started");
    }
    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread([this]() { loop(); });
    spdlog::info("Daily download scheduled at {:02}:{:02}", hour_, minute_);
}

void DailyScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

bool DailyScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stop_requested_;
}

void DailyScheduler::loop() {
    while (true) {
        const auto fire = nextFireTime(clock_(), hour_, minute_);
        spdlog::debug("Next scheduled run at {}",
                      std::chrono::system_clock::to_time_t(fire));

        {
            std::unique_lock<std::mutex> lock(mutex_);
            // clock_ may differ from the system clock; it is polled at least once a second.
            while (!stop_requested_ && clock_() < fire) {
                cv_.wait_until(lock, std::min(fire, std::chrono::system_clock::now() + std::chrono::seconds(1)));
            }
            if (stop_requested_) {
                return;
            }
        }

        try {
            trigger_(clock_());
        } catch (const std::exception& e) {
            spdlog::error("Scheduled run failed: {}", e.what());
        }
    }
}

} // namespace rtufetch

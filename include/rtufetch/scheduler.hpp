#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace rtufetch {

// Next local time point at hour:minute strictly after now.
[[nodiscard]] std::chrono::system_clock::time_point nextFireTime(std::chrono::system_clock::time_point now,
                                                                 int hour, int minute);

// Fires trigger once a day at the configured local time, on its own thread.
class DailyScheduler {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using Trigger = std::function<void(std::chrono::system_clock::time_point)>;

    DailyScheduler(int hour, int minute, Trigger trigger);
    DailyScheduler(int hour, int minute, Trigger trigger, Clock clock);
    ~DailyScheduler();

    DailyScheduler(const DailyScheduler&) = delete;
    DailyScheduler& operator=(const DailyScheduler&) = delete;

    // Throws FetchError(InvalidState) when already started.
    void start();
    // Interrupts the wait and joins the thread. Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool isRunning() const;

private:
    void loop();

    int hour_;
    int minute_;
    Trigger trigger_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    bool stop_requested_{false};
    std::thread worker_;
};

} // namespace rtufetch

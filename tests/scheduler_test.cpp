#include "rtufetch/scheduler.hpp"
#include "rtufetch/error.hpp"

#include <atomic>
#include <ctime>
#include <future>
#include <mutex>

#include <gtest/gtest.h>

using namespace rtufetch;
using Clock = std::chrono::system_clock;

namespace {

Clock::time_point localTime(int year, int month, int day, int hour, int minute) {
    std::tm local{};
    local.tm_year = year - 1900;
    local.tm_mon = month - 1;
    local.tm_mday = day;
    local.tm_hour = hour;
    local.tm_min = minute;
    local.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&local));
}

} // namespace

TEST(SchedulerTest, NextFireLaterToday) {
    EXPECT_EQ(nextFireTime(localTime(2024, 12, 15, 0, 5), 0, 10), localTime(2024, 12, 15, 0, 10));
}

TEST(SchedulerTest, NextFireTomorrowOncePassed) {
    EXPECT_EQ(nextFireTime(localTime(2024, 12, 15, 0, 10), 0, 10), localTime(2024, 12, 16, 0, 10));
    EXPECT_EQ(nextFireTime(localTime(2024, 12, 31, 23, 0), 0, 10), localTime(2025, 1, 1, 0, 10));
}

TEST(SchedulerTest, RejectsInvalidTime) {
    EXPECT_THROW(nextFireTime(Clock::now(), 24, 0), FetchError);
    EXPECT_THROW(DailyScheduler(0, 60, [](Clock::time_point) {}), FetchError);
}

TEST(SchedulerTest, FiresWhenClockReachesScheduleTime) {
    std::mutex mutex;
    Clock::time_point fake_now = localTime(2024, 12, 16, 0, 9);
    auto clock = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return fake_now;
    };

    std::promise<Clock::time_point> fired;
    std::atomic<int> calls{0};
    DailyScheduler scheduler(0, 10, [&](Clock::time_point now) {
        if (calls++ == 0) {
            fired.set_value(now);
        }
    }, clock);

    scheduler.start();
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_THROW(scheduler.start(), FetchError);

    {
        std::lock_guard<std::mutex> lock(mutex);
        fake_now = localTime(2024, 12, 16, 0, 10);
    }

    auto future = fired.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get(), localTime(2024, 12, 16, 0, 10));

    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(calls.load(), 1);
}

TEST(SchedulerTest, StopInterruptsWait) {
    std::atomic<int> calls{0};
    DailyScheduler scheduler(3, 0, [&](Clock::time_point) { ++calls; },
                             [] { return Clock::now(); });
    scheduler.start();
    scheduler.stop();
    scheduler.stop();
    EXPECT_EQ(calls.load(), 0);
}

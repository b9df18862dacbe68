#include "rtufetch/control_token.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

using rtufetch::ControlToken;

TEST(ControlTokenTest, PassesWhenIdle) {
    ControlToken token;
    EXPECT_TRUE(token.checkpoint());
}

TEST(ControlTokenTest, BlocksUntilResumed) {
    ControlToken token;
    token.requestPause();

    std::atomic<bool> passed{false};
    std::thread worker([&] { passed = token.checkpoint(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(passed.load());

    token.requestResume();
    worker.join();
    EXPECT_TRUE(passed.load());
}

TEST(ControlTokenTest, CancelWinsOverPause) {
    ControlToken token;
    token.requestPause();

    std::atomic<bool> result{true};
    std::thread worker([&] { result = token.checkpoint(); });

    token.requestCancel();
    worker.join();
    EXPECT_FALSE(result.load());
    EXPECT_TRUE(token.cancelRequested());
}

TEST(ControlTokenTest, CancelCannotBeWithdrawn) {
    ControlToken token;
    token.requestCancel();
    token.requestResume();
    EXPECT_FALSE(token.checkpoint());
}

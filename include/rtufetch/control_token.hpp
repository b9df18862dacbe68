#pragma once

#include <condition_variable>
#include <mutex>

namespace rtufetch {

// Pause / cancel signal shared between a session's controller and its run loop.
// The run loop calls checkpoint() at every date boundary and before every file.
// Cancellation wins over pause and cannot be withdrawn.
class ControlToken {
public:
    void requestPause();
    void requestResume();
    void requestCancel();

    [[nodiscard]] bool pauseRequested() const;
    [[nodiscard]] bool cancelRequested() const;

    // Blocks while paused. Returns false once cancellation was requested.
    [[nodiscard]] bool checkpoint();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_{false};
    bool cancelled_{false};
};

} // namespace rtufetch

#include "rtufetch/control_token.hpp"

namespace rtufetch {

void ControlToken::requestPause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void ControlToken::requestResume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

void ControlToken::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool ControlToken::pauseRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool ControlToken::cancelRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool ControlToken::checkpoint() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || !paused_; });
    return !cancelled_;
}

} // namespace rtufetch

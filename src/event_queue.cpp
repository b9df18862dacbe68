#include "rtufetch/event_queue.hpp"

#include <utility>

namespace rtufetch {

void EventQueue::push(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

bool EventQueue::pop(ProgressEvent& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return false;
    }
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

} // namespace rtufetch

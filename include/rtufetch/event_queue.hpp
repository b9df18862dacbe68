#pragma once

#include "progress.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>

namespace rtufetch {

// Multi-producer, single-consumer channel carrying ProgressEvents from sessions
// to the orchestrator. Events from one producer keep their order.
class EventQueue {
public:
    void push(ProgressEvent event);

    // Waits for the next event. Returns false once closed and drained.
    bool pop(ProgressEvent& out);

    // Wakes the consumer; events already queued are still delivered.
    void close();

    [[nodiscard]] bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_{false};
};

} // namespace rtufetch

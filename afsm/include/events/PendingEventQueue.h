#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace AFSM {

/**
 * @brief Thread-safe FIFO of events triggered from handler code
 *
 * Events land here first and re-enter the machine's channel one at a time, after the
 * transition that triggered them has fully completed. push() never blocks beyond the
 * short critical section and may be called from any thread.
 */
template <typename E> class PendingEventQueue {
public:
    void push(const E &event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    /**
     * @brief Remove and return the oldest pending event
     * @return The event, or nullopt when the queue is empty
     */
    std::optional<E> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            return std::nullopt;
        }
        E event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    /**
     * @brief Drop every pending event
     * @return Number of events dropped
     */
    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t dropped = events_.size();
        events_.clear();
        return dropped;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::deque<E> events_;
};

}  // namespace AFSM

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace AFSM {

/**
 * @brief Unbounded, closable event channel with a blocking receive
 *
 * The single entry point through which events reach a machine's consumer loop.
 * Any number of senders, exactly one receiver (the consumer thread).
 *
 * Closing is terminal: send() is refused afterwards, and receive() returns nullopt
 * on its next call even when events are still buffered. A closed channel is never
 * reopened; StateMachine::reset() installs a new one instead.
 */
template <typename E> class EventChannel {
public:
    EventChannel() = default;
    EventChannel(const EventChannel &) = delete;
    EventChannel &operator=(const EventChannel &) = delete;

    /**
     * @brief Deliver an event to the receiver
     * @return false if the channel is already closed (event dropped)
     */
    bool send(const E &event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            events_.push(event);
        }
        condition_.notify_one();
        return true;
    }

    /**
     * @brief Block until an event is available or the channel is closed
     * @return Next event, or nullopt once the channel has been closed
     */
    std::optional<E> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return closed_ || !events_.empty(); });

        if (closed_) {
            return std::nullopt;
        }

        E event = std::move(events_.front());
        events_.pop();
        return event;
    }

    /**
     * @brief Close the channel and wake the receiver
     *
     * Idempotent. Buffered events are discarded.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            std::queue<E> empty;
            events_.swap(empty);
        }
        condition_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::queue<E> events_;
    bool closed_ = false;
};

}  // namespace AFSM

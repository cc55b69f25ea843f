#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace AFSM {

/**
 * @brief Current-state holder readable from any thread
 *
 * Written by the consumer loop (and by StateMachine::finish()), read by anyone.
 * A reader-writer lock instead of std::atomic so that State may be any copyable type.
 */
template <typename S> class StateCell {
public:
    explicit StateCell(S initial) : value_(std::move(initial)) {}

    S load() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return value_;
    }

    void store(S value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        value_ = std::move(value);
    }

private:
    mutable std::shared_mutex mutex_;
    S value_;
};

}  // namespace AFSM

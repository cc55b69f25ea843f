#pragma once

#include "common/FormatHelper.h"
#include "common/Logger.h"
#include "events/EventChannel.h"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace AFSM {

/**
 * @brief Receive loop over one EventChannel
 *
 * run() blocks the calling thread, handing every received event to onReceive until
 * the channel is closed, then calls onClose. Exceptions thrown by the callbacks are
 * not caught here; they leave run() and end the loop.
 *
 * The consumer is rebound to a fresh channel with reset() once the previous one has
 * been closed; a running loop keeps the channel it started with.
 */
template <typename E> class EventConsumer {
public:
    using ReceiveCallback = std::function<void(const E &)>;
    using CloseCallback = std::function<void()>;

    explicit EventConsumer(std::shared_ptr<EventChannel<E>> channel) : channel_(std::move(channel)) {
        if (!channel_) {
            throw std::invalid_argument("EventConsumer requires a valid channel");
        }
    }

    void run(const ReceiveCallback &onReceive, const CloseCallback &onClose) {
        auto channel = getChannel();
        LOG_DEBUG("Starting event consumer...");

        while (auto event = channel->receive()) {
            LOG_DEBUG("Event {} received", describe(*event));
            onReceive(*event);
        }

        LOG_DEBUG("Channel closed to receive events");
        if (onClose) {
            onClose();
        }
    }

    /**
     * @brief Bind the consumer to a new channel for the next run()
     */
    void reset(std::shared_ptr<EventChannel<E>> channel) {
        if (!channel) {
            throw std::invalid_argument("EventConsumer requires a valid channel");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        channel_ = std::move(channel);
    }

    /**
     * @brief Close the bound channel; a running loop exits on its next receive
     */
    void stop() {
        getChannel()->close();
    }

    std::shared_ptr<EventChannel<E>> getChannel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return channel_;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<EventChannel<E>> channel_;
};

}  // namespace AFSM

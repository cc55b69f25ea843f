#pragma once

#include "common/FormatHelper.h"
#include "common/Logger.h"
#include "events/PendingEventQueue.h"
#include <memory>
#include <stdexcept>
#include <utility>

namespace AFSM {

/**
 * @brief The only capability handler code gets over its machine
 *
 * trigger() defers the event: it is appended to the machine's pending queue and
 * reaches the consumer loop only after the current transition (handlers, side
 * effect callback, state update) has completed. Handlers therefore can never
 * cause a nested transition.
 *
 * The controller shares ownership of the pending queue, so it stays safe to call
 * from other threads as long as the queue is alive; events triggered after the
 * run has stopped are simply never delivered.
 */
template <typename E> class Controller {
public:
    explicit Controller(std::shared_ptr<PendingEventQueue<E>> pendingEvents) : pendingEvents_(std::move(pendingEvents)) {
        if (!pendingEvents_) {
            throw std::invalid_argument("Controller requires a valid pending event queue");
        }
    }

    /**
     * @brief Enqueue an event for processing after the current transition
     */
    void trigger(const E &event) {
        LOG_DEBUG("Enqueuing event {}", describe(event));
        pendingEvents_->push(event);
    }

private:
    std::shared_ptr<PendingEventQueue<E>> pendingEvents_;
};

}  // namespace AFSM

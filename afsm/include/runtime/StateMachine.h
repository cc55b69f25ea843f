// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-AFSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of AFSM (Async Finite State Machine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (https://www.gnu.org/licenses/old-licenses/lgpl-2.1.html)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#pragma once

#include "common/ExceptionUtils.h"
#include "common/FormatHelper.h"
#include "common/Logger.h"
#include "events/EventChannel.h"
#include "events/PendingEventQueue.h"
#include "model/TransitionTable.h"
#include "runtime/Controller.h"
#include "runtime/EventConsumer.h"
#include "runtime/StateCell.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace AFSM {

/**
 * @brief Asynchronous finite state machine over caller-defined types
 *
 * One run = one worker thread consuming an EventChannel. For each received event the
 * worker looks up the transition for (current state, event), executes the transition's
 * handlers in order, fires the side-effect callback, moves to the target state and then
 * either stops (Finish action or handler failure) or forwards the next event triggered
 * by handler code. Only one transition is ever in flight.
 *
 * Outcomes are observable only through the onTransition/onException callbacks and
 * getCurrentState(); start() does not wait for the run.
 *
 * The context is owned by the worker thread while a run is active. Touching it from
 * other threads during a run is undefined behaviour; read it from the callbacks, or use
 * a pointer-like Context type and inspect it after awaitStop().
 *
 * Lifecycle operations (start, reset) must not be called from the machine's own
 * handlers or callbacks; finish() may be, and takes effect once the current transition
 * has completed.
 *
 * A machine owned by a shared_ptr (as returned by StateMachineBuilder) is kept alive by
 * its worker thread until the run ends, so the last owner may be released from inside a
 * callback. Releasing every owner while the run waits for an event keeps it waiting;
 * call finish() first.
 *
 * @tparam S State type (copyable, operator==)
 * @tparam E Event type (copyable, operator==)
 * @tparam SE Side effect type (copyable)
 * @tparam C Context type (movable)
 */
template <typename S, typename E, typename SE, typename C>
class StateMachine : public std::enable_shared_from_this<StateMachine<S, E, SE, C>> {
public:
    using TransitionType = Transition<S, E, SE, C>;
    using TableType = TransitionTable<S, E, SE, C>;
    using ControllerType = Controller<E>;

    /**
     * @brief Called after a successful transition that carries a side effect
     * (previous state, event, target state, side effect, context)
     */
    using TransitionCallback = std::function<void(const S &, const E &, const S &, const SE &, C &)>;

    /**
     * @brief Called once when a handler fails (context, state, event, failure)
     */
    using ExceptionCallback = std::function<void(C &, const S &, const E &, std::exception_ptr)>;

    /**
     * @brief Where the consumer loop currently is
     */
    enum class LoopState {
        Idle,              // never started
        Running,           // executing a transition
        WaitingNextEvent,  // blocked on the channel
        Finishing,         // last transition done, channel being closed
        Stopped            // loop exited
    };

    /**
     * @brief Create a machine in its initial state
     *
     * @throws ConfigurationError if the table is empty or has no Finish transition
     */
    StateMachine(std::string name, S initialState, TableType transitions, TransitionCallback onTransition = nullptr,
                 ExceptionCallback onException = nullptr)
        : name_(std::move(name)), initialState_(initialState), transitions_(std::move(transitions)),
          onTransition_(std::move(onTransition)), onException_(std::move(onException)), currentState_(initialState),
          pendingEvents_(std::make_shared<PendingEventQueue<E>>()), consumer_(std::make_shared<EventChannel<E>>()) {
        transitions_.validate(name_);

        if (!onException_) {
            onException_ = [this](C &, const S &state, const E &event, std::exception_ptr failure) {
                LOG_ERROR("State machine '{}' failed with no exception handlers (state: {}, event: {}): {}", name_,
                          describe(state), describe(event), describeException(failure));
            };
        }

        LOG_DEBUG("State machine '{}' created with {} transitions, initial state {}", name_, transitions_.size(),
                  describe(initialState_));
    }

    ~StateMachine() {
        consumer_.stop();
        if (worker_.joinable()) {
            if (isWorkerThread()) {
                LOG_DEBUG("State machine '{}' released by its own consumer thread", name_);
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

    StateMachine(const StateMachine &) = delete;
    StateMachine &operator=(const StateMachine &) = delete;

    /**
     * @brief Begin a run: install the context, launch the consumer and send the first event
     *
     * Returns as soon as the event is queued.
     *
     * @return false if a run is already active, the channel was closed by a previous run
     *         (use reset()), or the call comes from the consumer thread
     */
    bool start(const E &event, C context) {
        if (isWorkerThread()) {
            LOG_ERROR("State machine '{}': start() called from its own consumer thread", name_);
            return false;
        }
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        return startUnlocked(event, std::move(context));
    }

    /**
     * @brief Return to the initial state and stop the consumer
     *
     * Leaves the machine ready to be started again through reset().
     */
    void finish() {
        if (isWorkerThread()) {
            finishUnlocked();
            return;
        }
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        finishUnlocked();
    }

    /**
     * @brief finish(), then start a new run on a fresh channel
     *
     * Events still pending from the previous run are dropped.
     */
    bool reset(const E &event, C context) {
        if (isWorkerThread()) {
            LOG_ERROR("State machine '{}': reset() called from its own consumer thread", name_);
            return false;
        }
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        finishUnlocked();

        LOG_INFO("Resetting state machine '{}'...", name_);
        consumer_.reset(std::make_shared<EventChannel<E>>());
        size_t dropped = pendingEvents_->clear();
        if (dropped > 0) {
            LOG_DEBUG("State machine '{}': dropped {} pending events from the previous run", name_, dropped);
        }

        return startUnlocked(event, std::move(context));
    }

    S getCurrentState() const {
        return currentState_.load();
    }

    const std::string &getName() const {
        return name_;
    }

    const S &getInitialState() const {
        return initialState_;
    }

    /**
     * @brief True while a consumer loop is alive
     */
    bool isRunning() const {
        return running_.load();
    }

    /**
     * @brief True if the last run stopped because a handler failed
     */
    bool hasFailed() const {
        return failed_.load();
    }

    LoopState getLoopState() const {
        return loopState_.load();
    }

    /**
     * @brief Wait for the consumer loop of the current run to exit
     *
     * @return true once the loop has exited (or was never started), false on timeout
     * @throws the failure that escaped a handler's error() or a callback and ended the loop
     */
    bool awaitStop(std::chrono::milliseconds timeout) {
        std::shared_future<void> stopped;
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            stopped = stopped_;
        }

        if (!stopped.valid()) {
            return true;
        }
        if (stopped.wait_for(timeout) != std::future_status::ready) {
            return false;
        }

        stopped.get();
        return true;
    }

private:
    bool startUnlocked(const E &event, C context) {
        if (running_.load()) {
            LOG_WARN("State machine '{}' is already running, start ignored", name_);
            return false;
        }

        auto channel = consumer_.getChannel();
        if (channel->isClosed()) {
            LOG_ERROR("State machine '{}': event channel is closed, use reset() to run again", name_);
            return false;
        }

        // Previous worker already left its loop; reap it before launching a new one
        joinWorker();

        LOG_INFO("Starting state machine '{}' on event {}", name_, describe(event));

        context_.emplace(std::move(context));
        failed_.store(false);
        finishRequested_.store(false);
        pendingEvents_->clear();

        std::promise<void> stopped;
        stopped_ = stopped.get_future().share();
        running_.store(true);
        loopState_.store(LoopState::Running);

        // Released when the thread ends; if it is the last owner the machine is destroyed on the worker
        auto self = this->weak_from_this().lock();
        worker_ = std::thread([this, self = std::move(self), promise = std::move(stopped)]() mutable {
            runConsumer(std::move(promise));
        });
        workerId_.store(worker_.get_id());

        channel->send(event);
        return true;
    }

    void finishUnlocked() {
        LOG_INFO("Finishing state machine '{}'...", name_);
        consumer_.stop();

        if (isWorkerThread()) {
            // The current transition still stores its target state; processEvent() restores afterwards
            currentState_.store(initialState_);
            finishRequested_.store(true);
            return;
        }

        joinWorker();
        currentState_.store(initialState_);
    }

    void joinWorker() {
        if (worker_.joinable()) {
            worker_.join();
            workerId_.store(std::thread::id());
        }
    }

    void runConsumer(std::promise<void> stopped) {
        try {
            consumer_.run([this](const E &event) { processEvent(event); }, [this]() { onConsumerClosed(); });
            stopped.set_value();
        } catch (...) {
            // Escalated failure: ends the run and is handed to awaitStop()
            auto failure = std::current_exception();
            LOG_ERROR("State machine '{}' consumer terminated by an escalated failure: {}", name_,
                      describeException(failure));
            consumer_.stop();
            loopState_.store(LoopState::Stopped);
            running_.store(false);
            stopped.set_exception(failure);
        }
    }

    void onConsumerClosed() {
        LOG_DEBUG("State machine '{}' consumer stopped", name_);
        loopState_.store(LoopState::Stopped);
        running_.store(false);
    }

    void processEvent(const E &event) {
        loopState_.store(LoopState::Running);

        const S current = currentState_.load();
        const TransitionType *transition = transitions_.lookup(current, event);

        if (!transition) {
            LOG_WARN("State machine '{}': no transition found for state {} on event {}", name_, describe(current),
                     describe(event));
            loopState_.store(LoopState::WaitingNextEvent);
            return;
        }

        LOG_INFO("State machine '{}': event {} fired in state {}", name_, describe(event), describe(current));

        C &context = *context_;
        ControllerType controller(pendingEvents_);
        bool failed = false;

        for (const auto &handler : transition->handlers) {
            LOG_DEBUG("Start handler {}", handler->name());

            std::exception_ptr failure = handler->execute(controller, context, current, event);
            if (failure) {
                failed = true;
                failed_.store(true);
                onException_(context, current, event, failure);
                break;
            }

            LOG_DEBUG("Finishing handler {}", handler->name());
        }

        if (!failed && transition->effect && onTransition_) {
            LOG_DEBUG("Triggering side effect {}...", describe(*transition->effect));
            onTransition_(current, event, transition->to, *transition->effect, context);
            LOG_DEBUG("Side effect {} finished", describe(*transition->effect));
        }

        LOG_INFO("Transiting {} -> {}", describe(current), describe(transition->to));
        currentState_.store(transition->to);

        if (finishRequested_.exchange(false)) {
            currentState_.store(initialState_);
        }

        if (failed || transition->action == Action::Finish) {
            loopState_.store(LoopState::Finishing);
            consumer_.stop();
            return;
        }

        loopState_.store(LoopState::WaitingNextEvent);
        if (auto next = pendingEvents_->tryPop()) {
            LOG_DEBUG("Sending event {}...", describe(*next));
            consumer_.getChannel()->send(*next);
        }
    }

    bool isWorkerThread() const {
        return workerId_.load() == std::this_thread::get_id();
    }

    const std::string name_;
    const S initialState_;
    const TableType transitions_;
    TransitionCallback onTransition_;
    ExceptionCallback onException_;

    StateCell<S> currentState_;
    std::shared_ptr<PendingEventQueue<E>> pendingEvents_;
    EventConsumer<E> consumer_;

    // Owned by the worker thread while a run is active
    std::optional<C> context_;

    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<bool> finishRequested_{false};
    std::atomic<LoopState> loopState_{LoopState::Idle};

    std::mutex lifecycleMutex_;
    std::thread worker_;
    std::atomic<std::thread::id> workerId_{};
    std::shared_future<void> stopped_;
};

}  // namespace AFSM

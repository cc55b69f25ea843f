#pragma once

#include "events/IEventHandler.h"
#include <algorithm>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace AFSM {

/**
 * @brief What the machine does once a transition has completed
 */
enum class Action {
    None,   // keep running, forward the next pending event
    Finish  // stop the consumer loop
};

/**
 * @brief One configured rule: source events -> handlers -> target state (+ side effect)
 *
 * Built once by StateMachineBuilder and never mutated afterwards. The exceptions list
 * is only meaningful for wildcard transitions (configured with fromAll) and names the
 * states the transition must not apply to.
 */
template <typename S, typename E, typename SE, typename C> struct Transition {
    using HandlerPtr = std::shared_ptr<IEventHandler<S, E, SE, C>>;

    std::vector<S> exceptions;
    std::vector<E> on;
    std::vector<HandlerPtr> handlers;
    S to;
    std::optional<SE> effect;
    Action action = Action::None;

    Transition(std::vector<S> exceptStates, std::vector<E> events, std::vector<HandlerPtr> eventHandlers, S target,
               std::optional<SE> sideEffect = std::nullopt, Action transitionAction = Action::None)
        : exceptions(std::move(exceptStates)), on(std::move(events)), handlers(std::move(eventHandlers)),
          to(std::move(target)), effect(std::move(sideEffect)), action(transitionAction) {}

    bool isTriggeredBy(const E &event) const {
        return std::find(on.begin(), on.end(), event) != on.end();
    }

    bool isExcepted(const S &state) const {
        return std::find(exceptions.begin(), exceptions.end(), state) != exceptions.end();
    }
};

}  // namespace AFSM

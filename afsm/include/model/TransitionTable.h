#pragma once

#include "common/ConfigurationError.h"
#include "model/Transition.h"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace AFSM {

/**
 * @brief Source state -> ordered transitions, plus an ordered wildcard list
 *
 * Lookup for (current, event):
 * 1. the first transition registered for `current` whose event set contains `event`
 * 2. otherwise the first wildcard transition that contains `event` and does not list
 *    `current` among its exceptions
 *
 * Insertion order is the tie-break in both phases. States only need operator==, so
 * entries are kept in registration order and scanned linearly.
 */
template <typename S, typename E, typename SE, typename C> class TransitionTable {
public:
    using TransitionType = Transition<S, E, SE, C>;

    /**
     * @brief Append a transition to every listed source state
     *
     * An empty state list registers the transition as a wildcard.
     */
    void addTransition(const std::vector<S> &fromStates, const TransitionType &transition) {
        if (fromStates.empty()) {
            addWildcardTransition(transition);
            return;
        }
        for (const auto &state : fromStates) {
            transitionsFor(state).push_back(transition);
        }
    }

    void addWildcardTransition(const TransitionType &transition) {
        wildcard_.push_back(transition);
    }

    /**
     * @brief Find the transition that fires for an event in the given state
     * @return The transition, or nullptr when the event is not handled in that state
     */
    const TransitionType *lookup(const S &current, const E &event) const {
        for (const auto &entry : entries_) {
            if (!(entry.first == current)) {
                continue;
            }
            for (const auto &transition : entry.second) {
                if (transition.isTriggeredBy(event)) {
                    return &transition;
                }
            }
            break;
        }

        for (const auto &transition : wildcard_) {
            if (transition.isTriggeredBy(event) && !transition.isExcepted(current)) {
                return &transition;
            }
        }

        return nullptr;
    }

    bool empty() const {
        return size() == 0;
    }

    /**
     * @brief Total number of transitions, wildcard ones included
     */
    size_t size() const {
        size_t count = wildcard_.size();
        for (const auto &entry : entries_) {
            count += entry.second.size();
        }
        return count;
    }

    bool hasFinishTransition() const {
        auto isFinish = [](const TransitionType &transition) { return transition.action == Action::Finish; };

        for (const auto &entry : entries_) {
            for (const auto &transition : entry.second) {
                if (isFinish(transition)) {
                    return true;
                }
            }
        }
        for (const auto &transition : wildcard_) {
            if (isFinish(transition)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Reject tables that cannot produce a usable machine
     * @throws ConfigurationError on an empty table or a table without any Finish transition
     */
    void validate(const std::string &machineName) const {
        if (empty()) {
            throw ConfigurationError(ConfigurationError::Reason::EmptyTransitionTable, machineName);
        }
        if (!hasFinishTransition()) {
            throw ConfigurationError(ConfigurationError::Reason::MissingFinishTransition, machineName);
        }
    }

private:
    std::vector<TransitionType> &transitionsFor(const S &state) {
        for (auto &entry : entries_) {
            if (entry.first == state) {
                return entry.second;
            }
        }
        entries_.emplace_back(state, std::vector<TransitionType>{});
        return entries_.back().second;
    }

    std::vector<std::pair<S, std::vector<TransitionType>>> entries_;
    std::vector<TransitionType> wildcard_;
};

}  // namespace AFSM

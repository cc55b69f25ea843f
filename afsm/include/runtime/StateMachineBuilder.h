#pragma once

#include "common/ConfigurationError.h"
#include "common/Logger.h"
#include "events/FunctionEventHandler.h"
#include "model/TransitionTable.h"
#include "runtime/StateMachine.h"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace AFSM {

/**
 * @brief Collects transitions and callbacks, then produces a validated StateMachine
 *
 * Each from()/fromAll() call receives an OnEventScope; the scope's on() receives a
 * TransitionScope that gathers handlers and ends with goTo() or finishOn(), which yields
 * the transition registered for the listed states.
 *
 * @code
 * StateMachineBuilder<State, Event, Effect, Context> builder("Checkout", State::Initial);
 * builder.from({State::Initial}, [](auto &scope) {
 *     return scope.on({Event::Start}, [](auto &transition) {
 *         transition.execute([](auto &controller, Context &, const State &, const Event &) {
 *             controller.trigger(Event::Complete);
 *         });
 *         return transition.goTo(State::Paying, Effect::PaymentRequested);
 *     });
 * });
 * auto machine = builder.build();
 * @endcode
 */
template <typename S, typename E, typename SE, typename C> class StateMachineBuilder {
public:
    using Machine = StateMachine<S, E, SE, C>;
    using TransitionType = Transition<S, E, SE, C>;
    using HandlerPtr = typename TransitionType::HandlerPtr;
    using HandlerFunction = typename FunctionEventHandler<S, E, SE, C>::HandlerFunction;
    using TransitionCallback = typename Machine::TransitionCallback;
    using ExceptionCallback = typename Machine::ExceptionCallback;

    /**
     * @brief Result type for tryBuild()
     */
    struct BuildResult {
        std::shared_ptr<Machine> value;
        std::string error;
        bool success;

        BuildResult(std::shared_ptr<Machine> machine) : value(std::move(machine)), success(true) {}

        BuildResult(const std::string &err) : error(err), success(false) {}

        bool has_value() const {
            return success;
        }

        explicit operator bool() const {
            return success;
        }
    };

    /**
     * @brief Handlers and target of a single transition
     */
    class TransitionScope {
    public:
        TransitionScope(std::vector<S> exceptions, std::vector<E> events)
            : exceptions_(std::move(exceptions)), events_(std::move(events)) {}

        /**
         * @brief Append a handler; handlers run in the order they were added
         */
        TransitionScope &execute(HandlerPtr handler) {
            if (!handler) {
                throw std::invalid_argument("TransitionScope::execute requires a handler");
            }
            handlers_.push_back(std::move(handler));
            return *this;
        }

        TransitionScope &execute(HandlerFunction function, std::string name = "anonymous") {
            return execute(FunctionEventHandler<S, E, SE, C>::create(std::move(function), std::move(name)));
        }

        TransitionType goTo(S to, std::optional<SE> effect = std::nullopt) const {
            return TransitionType(exceptions_, events_, handlers_, std::move(to), std::move(effect), Action::None);
        }

        /**
         * @brief Like goTo(), but the machine stops once the transition has completed
         */
        TransitionType finishOn(S to, std::optional<SE> effect = std::nullopt) const {
            return TransitionType(exceptions_, events_, handlers_, std::move(to), std::move(effect), Action::Finish);
        }

    private:
        std::vector<S> exceptions_;
        std::vector<E> events_;
        std::vector<HandlerPtr> handlers_;
    };

    using TransitionBuilder = std::function<TransitionType(TransitionScope &)>;

    /**
     * @brief Event selection for one from()/fromAll() block
     */
    class OnEventScope {
    public:
        explicit OnEventScope(std::vector<S> exceptions = {}) : exceptions_(std::move(exceptions)) {}

        TransitionType on(std::vector<E> events, const TransitionBuilder &build) const {
            if (events.empty()) {
                throw std::invalid_argument("OnEventScope::on requires at least one event");
            }
            TransitionScope scope(exceptions_, std::move(events));
            return build(scope);
        }

    private:
        std::vector<S> exceptions_;
    };

    using StatesBuilder = std::function<TransitionType(OnEventScope &)>;

    StateMachineBuilder(std::string name, S initialState) : name_(std::move(name)), initialState_(std::move(initialState)) {}

    /**
     * @brief Register one transition for each listed source state
     *
     * The block is evaluated once per state, so handlers created inside it are not
     * shared between states.
     */
    StateMachineBuilder &from(const std::vector<S> &states, const StatesBuilder &build) {
        for (const auto &state : states) {
            OnEventScope scope;
            table_.addTransition({state}, build(scope));
        }
        return *this;
    }

    /**
     * @brief Register a wildcard transition applying to every state except the listed ones
     */
    StateMachineBuilder &fromAll(const std::vector<S> &exceptStates, const StatesBuilder &build) {
        OnEventScope scope(exceptStates);
        table_.addWildcardTransition(build(scope));
        return *this;
    }

    StateMachineBuilder &onTransition(TransitionCallback callback) {
        onTransition_ = std::move(callback);
        return *this;
    }

    /**
     * @brief Replace the default (log only) handler-failure callback
     */
    StateMachineBuilder &onException(ExceptionCallback callback) {
        onException_ = std::move(callback);
        return *this;
    }

    /**
     * @brief Build the machine
     * @throws ConfigurationError if no transition or no Finish transition was configured
     */
    std::shared_ptr<Machine> build() const {
        return std::make_shared<Machine>(name_, initialState_, table_, onTransition_, onException_);
    }

    /**
     * @brief Build the machine, reporting configuration problems in the result
     */
    BuildResult tryBuild() const {
        try {
            return BuildResult(build());
        } catch (const ConfigurationError &e) {
            LOG_ERROR("Failed to build state machine '{}': {}", name_, e.what());
            return BuildResult(std::string(e.what()));
        }
    }

private:
    std::string name_;
    S initialState_;
    TransitionTable<S, E, SE, C> table_;
    TransitionCallback onTransition_;
    ExceptionCallback onException_;
};

/**
 * @brief Build a machine from a configuration block
 *
 * @code
 * auto machine = AFSM::build<State, Event, Effect, Context>("Checkout", State::Initial, [](auto &builder) {
 *     builder.from({State::Initial}, ...).onTransition(...);
 * });
 * @endcode
 *
 * @throws ConfigurationError if the configured table cannot produce a runnable machine
 */
template <typename S, typename E, typename SE, typename C>
std::shared_ptr<StateMachine<S, E, SE, C>>
build(const std::string &name, S initialState,
      const std::type_identity_t<std::function<void(StateMachineBuilder<S, E, SE, C> &)>> &configure) {
    StateMachineBuilder<S, E, SE, C> builder(name, std::move(initialState));
    if (configure) {
        configure(builder);
    }
    return builder.build();
}

}  // namespace AFSM

#pragma once

#include "common/ExceptionUtils.h"
#include "common/FormatHelper.h"
#include "common/HandlerEscalation.h"
#include "common/Logger.h"
#include "runtime/Controller.h"
#include <exception>
#include <string>

namespace AFSM {

/**
 * @brief Outcome of IEventHandler::validate()
 */
enum class ValidationResult { Valid, Invalid };

/**
 * @brief Transition-time logic following the validate/handle/error/exception protocol
 *
 * For every transition that fires, the machine runs the transition's handlers in
 * order on its consumer thread:
 *
 * - validate() decides, without side effects, whether the handler applies
 * - Valid   -> handle(): may mutate the context, trigger follow-up events and throw
 * - Invalid -> error(): a rejection, not a failure; the transition proceeds normally
 * - handle() threw -> exception() with the captured failure; the run is marked failed
 *
 * error() and exception() must not throw. Anything thrown from error() terminates the
 * consumer loop (see StateMachine::awaitStop()). exception() may only throw
 * HandlerEscalation, which then replaces the original failure for the run.
 *
 * @tparam S State type
 * @tparam E Event type
 * @tparam SE Side effect type
 * @tparam C Context type
 */
template <typename S, typename E, typename SE, typename C> class IEventHandler {
public:
    using ControllerType = Controller<E>;

    virtual ~IEventHandler() = default;

    virtual ValidationResult validate(const ControllerType &controller, const C &context, const S &state,
                                      const E &event) = 0;

    virtual void handle(ControllerType &controller, C &context, const S &state, const E &event) = 0;

    virtual void error(ControllerType &controller, C &context, const S &state, const E &event) = 0;

    virtual void exception(ControllerType &controller, std::exception_ptr failure, C &context, const S &state,
                           const E &event) = 0;

    /**
     * @brief Label used in log messages
     */
    virtual std::string name() const {
        return "handler";
    }

    /**
     * @brief Run the full protocol once
     *
     * @return Failure of the run (null when handle() succeeded or validation was rejected).
     *         A HandlerEscalation raised by exception() is returned in place of the
     *         original failure.
     */
    std::exception_ptr execute(ControllerType &controller, C &context, const S &state, const E &event) {
        std::exception_ptr failure;

        switch (validate(controller, context, state, event)) {
        case ValidationResult::Valid:
            try {
                handle(controller, context, state, event);
            } catch (...) {
                failure = std::current_exception();
            }
            break;
        case ValidationResult::Invalid:
            LOG_DEBUG("Handler '{}' rejected event {} in state {}", name(), describe(event), describe(state));
            error(controller, context, state, event);
            return nullptr;
        }

        if (!failure) {
            return nullptr;
        }

        LOG_ERROR("Handler '{}' failed on event {} in state {}: {}", name(), describe(event), describe(state),
                  describeException(failure));

        try {
            exception(controller, failure, context, state, event);
        } catch (const HandlerEscalation &escalation) {
            LOG_ERROR("Handler '{}' escalated: {}", name(), escalation.what());
            return std::current_exception();
        }

        return failure;
    }
};

}  // namespace AFSM

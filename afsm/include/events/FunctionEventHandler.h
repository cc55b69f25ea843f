#pragma once

#include "events/IEventHandler.h"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace AFSM {

/**
 * @brief Handler built from a bare handle function
 *
 * validate() always accepts. The wrapped function declares no failure path, so
 * error() and exception() escalate with HandlerEscalation: a throwing function
 * fails the run with a HandlerEscalation whose cause() is the original exception.
 */
template <typename S, typename E, typename SE, typename C>
class FunctionEventHandler : public IEventHandler<S, E, SE, C> {
public:
    using ControllerType = typename IEventHandler<S, E, SE, C>::ControllerType;
    using HandlerFunction = std::function<void(ControllerType &, C &, const S &, const E &)>;

    explicit FunctionEventHandler(HandlerFunction function, std::string name = "anonymous")
        : function_(std::move(function)), name_(std::move(name)) {
        if (!function_) {
            throw std::invalid_argument("FunctionEventHandler requires a callable");
        }
    }

    static std::shared_ptr<FunctionEventHandler> create(HandlerFunction function, std::string name = "anonymous") {
        return std::make_shared<FunctionEventHandler>(std::move(function), std::move(name));
    }

    ValidationResult validate(const ControllerType &, const C &, const S &, const E &) override {
        return ValidationResult::Valid;
    }

    void handle(ControllerType &controller, C &context, const S &state, const E &event) override {
        function_(controller, context, state, event);
    }

    void error(ControllerType &, C &, const S &, const E &) override {
        throw HandlerEscalation("Handler '" + name_ + "' should never be rejected");
    }

    void exception(ControllerType &, std::exception_ptr failure, C &, const S &, const E &) override {
        throw HandlerEscalation("Handler '" + name_ + "' should neither throw nor handle exceptions",
                                std::move(failure));
    }

    std::string name() const override {
        return name_;
    }

private:
    HandlerFunction function_;
    std::string name_;
};

}  // namespace AFSM

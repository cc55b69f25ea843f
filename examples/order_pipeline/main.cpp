#include "AFSM.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

enum class OrderState { Created, Reserved, Paid, Shipped, Cancelled };
enum class OrderEvent { Reserve, Pay, Ship, Cancel };
enum class OrderEffect { StockReserved, PaymentCaptured, ParcelSent, OrderCancelled };

const char *toString(OrderState state) {
    switch (state) {
    case OrderState::Created:
        return "Created";
    case OrderState::Reserved:
        return "Reserved";
    case OrderState::Paid:
        return "Paid";
    case OrderState::Shipped:
        return "Shipped";
    case OrderState::Cancelled:
        return "Cancelled";
    }
    return "?";
}

const char *toString(OrderEffect effect) {
    switch (effect) {
    case OrderEffect::StockReserved:
        return "StockReserved";
    case OrderEffect::PaymentCaptured:
        return "PaymentCaptured";
    case OrderEffect::ParcelSent:
        return "ParcelSent";
    case OrderEffect::OrderCancelled:
        return "OrderCancelled";
    }
    return "?";
}

struct Order {
    std::string id;
    int quantity = 0;
    int stock = 0;
    bool cardDeclined = false;
};

using OrderPtr = std::shared_ptr<Order>;
using OrderMachine = AFSM::StateMachine<OrderState, OrderEvent, OrderEffect, OrderPtr>;
using OrderBuilder = AFSM::StateMachineBuilder<OrderState, OrderEvent, OrderEffect, OrderPtr>;
using OrderController = AFSM::Controller<OrderEvent>;

/**
 * @brief Reserves stock; rejects orders above the available quantity
 */
class ReserveStock : public AFSM::IEventHandler<OrderState, OrderEvent, OrderEffect, OrderPtr> {
public:
    AFSM::ValidationResult validate(const OrderController &, const OrderPtr &order, const OrderState &,
                                    const OrderEvent &) override {
        return order->quantity <= order->stock ? AFSM::ValidationResult::Valid : AFSM::ValidationResult::Invalid;
    }

    void handle(OrderController &controller, OrderPtr &order, const OrderState &, const OrderEvent &) override {
        order->stock -= order->quantity;
        controller.trigger(OrderEvent::Pay);
    }

    void error(OrderController &controller, OrderPtr &order, const OrderState &, const OrderEvent &) override {
        std::cout << "  [" << order->id << "] not enough stock, cancelling" << "\n";
        controller.trigger(OrderEvent::Cancel);
    }

    void exception(OrderController &, std::exception_ptr failure, OrderPtr &order, const OrderState &,
                   const OrderEvent &) override {
        std::cout << "  [" << order->id << "] reservation failed: " << AFSM::describeException(failure) << "\n";
    }

    std::string name() const override {
        return "reserve-stock";
    }
};

std::shared_ptr<OrderMachine> buildPipeline() {
    return AFSM::build<OrderState, OrderEvent, OrderEffect, OrderPtr>(
        "OrderPipeline", OrderState::Created, [](OrderBuilder &builder) {
            builder.from({OrderState::Created}, [](OrderBuilder::OnEventScope &scope) {
                return scope.on({OrderEvent::Reserve}, [](OrderBuilder::TransitionScope &transition) {
                    transition.execute(std::make_shared<ReserveStock>());
                    return transition.goTo(OrderState::Reserved, OrderEffect::StockReserved);
                });
            });

            builder.from({OrderState::Reserved}, [](OrderBuilder::OnEventScope &scope) {
                return scope.on({OrderEvent::Pay}, [](OrderBuilder::TransitionScope &transition) {
                    transition.execute(
                        [](OrderController &controller, OrderPtr &order, const OrderState &, const OrderEvent &) {
                            if (order->cardDeclined) {
                                throw std::runtime_error("card declined");
                            }
                            controller.trigger(OrderEvent::Ship);
                        },
                        "capture-payment");
                    return transition.goTo(OrderState::Paid, OrderEffect::PaymentCaptured);
                });
            });

            builder.from({OrderState::Paid}, [](OrderBuilder::OnEventScope &scope) {
                return scope.on({OrderEvent::Ship}, [](OrderBuilder::TransitionScope &transition) {
                    return transition.finishOn(OrderState::Shipped, OrderEffect::ParcelSent);
                });
            });

            builder.fromAll({OrderState::Shipped, OrderState::Cancelled}, [](OrderBuilder::OnEventScope &scope) {
                return scope.on({OrderEvent::Cancel}, [](OrderBuilder::TransitionScope &transition) {
                    return transition.finishOn(OrderState::Cancelled, OrderEffect::OrderCancelled);
                });
            });

            builder
                .onTransition([](const OrderState &from, const OrderEvent &, const OrderState &to,
                                 const OrderEffect &effect, OrderPtr &order) {
                    std::cout << "  [" << order->id << "] " << toString(from) << " -> " << toString(to) << " ("
                              << toString(effect) << ")" << "\n";
                })
                .onException([](OrderPtr &order, const OrderState &state, const OrderEvent &,
                                std::exception_ptr failure) {
                    std::cout << "  [" << order->id << "] failed in " << toString(state) << ": "
                              << AFSM::describeException(failure) << "\n";
                });
        });
}

void runOrder(OrderMachine &machine, const OrderPtr &order, bool firstRun) {
    bool started = firstRun ? machine.start(OrderEvent::Reserve, order) : machine.reset(OrderEvent::Reserve, order);
    if (!started) {
        std::cout << "  [" << order->id << "] could not be started" << "\n";
        return;
    }

    if (!machine.awaitStop(std::chrono::seconds(5))) {
        std::cout << "  [" << order->id << "] timed out, finishing" << "\n";
        machine.finish();
        return;
    }

    std::cout << "  [" << order->id << "] ended in " << toString(machine.getCurrentState())
              << (machine.hasFailed() ? " (failed)" : "") << "\n";
}

}  // namespace

int main() {
    AFSM::Logger::initialize();
    AFSM::Logger::setLevel(AFSM::LogLevel::Warn);

    std::cout << "=== Order Pipeline Example ===" << "\n\n";

    auto machine = buildPipeline();

    std::cout << "Happy path:" << "\n";
    runOrder(*machine, std::make_shared<Order>(Order{"A-100", 2, 10, false}), true);

    std::cout << "\n" << "Out of stock:" << "\n";
    runOrder(*machine, std::make_shared<Order>(Order{"A-101", 20, 10, false}), false);

    std::cout << "\n" << "Payment failure:" << "\n";
    runOrder(*machine, std::make_shared<Order>(Order{"A-102", 1, 10, true}), false);

    machine->finish();
    return 0;
}

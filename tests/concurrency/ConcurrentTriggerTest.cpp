#include "common/TestMachineModel.h"
#include "common/TestUtils.h"
#include "events/EventChannel.h"
#include "events/PendingEventQueue.h"
#include "runtime/Controller.h"
#include "runtime/StateMachine.h"
#include "runtime/StateMachineBuilder.h"
#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace AFSM {

using namespace AFSM::Test;

/**
 * @brief Events raised concurrently from several threads must neither be lost nor reordered per sender
 */
class ConcurrentTriggerTest : public ::testing::Test {
protected:
    static constexpr int THREAD_COUNT = 8;
    static constexpr int EVENTS_PER_THREAD = 250;
};

TEST_F(ConcurrentTriggerTest, PendingQueueKeepsEveryEventFromConcurrentProducers) {
    auto queue = std::make_shared<PendingEventQueue<int>>();
    Controller<int> controller(queue);

    std::vector<std::thread> producers;
    for (int t = 0; t < THREAD_COUNT; ++t) {
        producers.emplace_back([&controller, t]() {
            for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
                controller.trigger(t * EVENTS_PER_THREAD + i);
            }
        });
    }
    for (auto &producer : producers) {
        producer.join();
    }

    ASSERT_EQ(queue->size(), static_cast<size_t>(THREAD_COUNT * EVENTS_PER_THREAD));

    // Per-producer order is preserved, and every value arrives exactly once
    std::vector<int> lastSeen(THREAD_COUNT, -1);
    std::set<int> seen;
    while (auto event = queue->tryPop()) {
        int producer = *event / EVENTS_PER_THREAD;
        EXPECT_GT(*event, lastSeen[producer]);
        lastSeen[producer] = *event;
        seen.insert(*event);
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(THREAD_COUNT * EVENTS_PER_THREAD));
}

TEST_F(ConcurrentTriggerTest, ChannelDeliversEverythingSentBeforeClose) {
    EventChannel<int> channel;
    std::atomic<int> received{0};

    std::thread receiver([&channel, &received]() {
        while (channel.receive()) {
            ++received;
        }
    });

    std::vector<std::thread> senders;
    for (int t = 0; t < THREAD_COUNT; ++t) {
        senders.emplace_back([&channel]() {
            for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
                EXPECT_TRUE(channel.send(i));
            }
        });
    }
    for (auto &sender : senders) {
        sender.join();
    }

    ASSERT_TRUE(Utils::waitUntil([&received] { return received.load() == THREAD_COUNT * EVENTS_PER_THREAD; }));
    channel.close();
    receiver.join();

    EXPECT_EQ(received.load(), THREAD_COUNT * EVENTS_PER_THREAD);
    EXPECT_FALSE(channel.send(0));
}

TEST_F(ConcurrentTriggerTest, MachineProcessesEventsTriggeredFromWorkerThreads) {
    TestBuilder builder("Fanout", State::Initial);
    recordCallbacks(builder);
    builder.from({State::Initial}, [](TestBuilder::OnEventScope &scope) {
        return scope.on({Event::Start}, [](TestBuilder::TransitionScope &transition) {
            transition.execute(
                [](TestController &controller, ContextPtr &, const State &, const Event &) {
                    std::vector<std::thread> workers;
                    for (int t = 0; t < THREAD_COUNT; ++t) {
                        workers.emplace_back([&controller]() {
                            for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
                                controller.trigger(Event::Next);
                            }
                        });
                    }
                    for (auto &worker : workers) {
                        worker.join();
                    }
                    controller.trigger(Event::Complete);
                },
                "fan-out");
            return transition.goTo(State::Mid, SideEffect::E1);
        });
    });
    builder.from({State::Mid}, [](TestBuilder::OnEventScope &scope) {
        return scope.on({Event::Next}, [](TestBuilder::TransitionScope &transition) {
            transition.execute([](TestController &, ContextPtr &context, const State &, const Event &) { ++context->one; },
                               "count");
            return transition.goTo(State::Mid);
        });
    });
    builder.from({State::Mid}, [](TestBuilder::OnEventScope &scope) {
        return scope.on({Event::Complete}, [](TestBuilder::TransitionScope &transition) {
            return transition.finishOn(State::Final, SideEffect::E2);
        });
    });
    auto machine = builder.build();

    auto context = makeContext(0);
    ASSERT_TRUE(machine->start(Event::Start, context));
    ASSERT_TRUE(machine->awaitStop(Utils::scaled(Utils::RUN_TIMEOUT_MS)));

    // Complete was triggered after every Next, so it is processed last
    EXPECT_EQ(context->one, THREAD_COUNT * EVENTS_PER_THREAD);
    ASSERT_EQ(context->transitions.size(), 2u);
    EXPECT_EQ(context->transitions.back().on, Event::Complete);
    EXPECT_EQ(machine->getCurrentState(), State::Final);
    machine->finish();
}

TEST_F(ConcurrentTriggerTest, IndependentMachinesRunInParallel) {
    constexpr int MACHINE_COUNT = 6;

    std::vector<std::shared_ptr<TestMachine>> machines;
    std::vector<ContextPtr> contexts;
    for (int m = 0; m < MACHINE_COUNT; ++m) {
        TestBuilder builder("Parallel-" + std::to_string(m), State::Initial);
        recordCallbacks(builder);
        builder.from({State::Initial}, [](TestBuilder::OnEventScope &scope) {
            return scope.on({Event::Start}, [](TestBuilder::TransitionScope &transition) {
                transition.execute([](TestController &controller, ContextPtr &, const State &,
                                      const Event &) { controller.trigger(Event::Complete); });
                return transition.goTo(State::Mid, SideEffect::E1);
            });
        });
        builder.from({State::Mid}, [](TestBuilder::OnEventScope &scope) {
            return scope.on({Event::Complete}, [](TestBuilder::TransitionScope &transition) {
                return transition.finishOn(State::Final, SideEffect::E2);
            });
        });
        machines.push_back(builder.build());
        contexts.push_back(makeContext(m));
    }

    for (int m = 0; m < MACHINE_COUNT; ++m) {
        ASSERT_TRUE(machines[m]->start(Event::Start, contexts[m]));
    }
    for (int m = 0; m < MACHINE_COUNT; ++m) {
        ASSERT_TRUE(machines[m]->awaitStop(Utils::scaled(Utils::RUN_TIMEOUT_MS)));
        EXPECT_EQ(machines[m]->getCurrentState(), State::Final);
        EXPECT_EQ(contexts[m]->transitions.size(), 2u);
        EXPECT_EQ(contexts[m]->one, m);
    }
    for (auto &machine : machines) {
        machine->finish();
    }
}

}  // namespace AFSM

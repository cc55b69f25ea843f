#include "common/TestUtils.h"
#include "events/EventChannel.h"
#include "runtime/EventConsumer.h"
#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace AFSM {

class EventConsumerTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<EventChannel<int>>();
        consumer_ = std::make_unique<EventConsumer<int>>(channel_);
    }

    std::shared_ptr<EventChannel<int>> channel_;
    std::unique_ptr<EventConsumer<int>> consumer_;
};

TEST_F(EventConsumerTest, RequiresChannel) {
    EXPECT_THROW(EventConsumer<int> consumer(nullptr), std::invalid_argument);
    EXPECT_THROW(consumer_->reset(nullptr), std::invalid_argument);
}

TEST_F(EventConsumerTest, HandsEventsToCallbackUntilStopped) {
    std::vector<int> received;
    std::atomic<bool> closed{false};

    channel_->send(1);
    channel_->send(2);

    std::thread loop([this, &received, &closed]() {
        consumer_->run(
            [this, &received](const int &event) {
                received.push_back(event);
                if (event == 3) {
                    consumer_->stop();
                }
            },
            [&closed]() { closed = true; });
    });

    channel_->send(3);
    loop.join();

    EXPECT_EQ(received, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(closed.load());
    EXPECT_TRUE(channel_->isClosed());
}

TEST_F(EventConsumerTest, CallbackExceptionLeavesRun) {
    channel_->send(1);
    bool closed = false;

    EXPECT_THROW(consumer_->run([](const int &) { throw std::runtime_error("callback failed"); },
                                [&closed]() { closed = true; }),
                 std::runtime_error);
    EXPECT_FALSE(closed);
}

TEST_F(EventConsumerTest, ResetBindsFreshChannel) {
    consumer_->stop();
    EXPECT_TRUE(channel_->isClosed());

    auto fresh = std::make_shared<EventChannel<int>>();
    consumer_->reset(fresh);
    EXPECT_EQ(consumer_->getChannel(), fresh);
    EXPECT_FALSE(fresh->isClosed());

    fresh->send(5);
    int received = 0;
    consumer_->run(
        [this, &received](const int &event) {
            received = event;
            consumer_->stop();
        },
        nullptr);
    EXPECT_EQ(received, 5);
}

TEST_F(EventConsumerTest, StopFromAnotherThreadEndsBlockedRun) {
    std::atomic<bool> finished{false};
    std::thread loop([this, &finished]() {
        consumer_->run([](const int &) {}, nullptr);
        finished = true;
    });

    std::this_thread::sleep_for(::AFSM::Test::Utils::STANDARD_WAIT_MS);
    EXPECT_FALSE(finished.load());

    consumer_->stop();
    loop.join();
    EXPECT_TRUE(finished.load());
}

}  // namespace AFSM

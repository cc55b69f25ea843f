#include "common/TestUtils.h"
#include "events/EventChannel.h"
#include <atomic>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <thread>

namespace AFSM {

class EventChannelTest : public ::testing::Test {
protected:
    EventChannel<std::string> channel_;
};

TEST_F(EventChannelTest, DeliversEventsInSendOrder) {
    EXPECT_TRUE(channel_.send("first"));
    EXPECT_TRUE(channel_.send("second"));
    EXPECT_EQ(channel_.size(), 2u);

    EXPECT_EQ(channel_.receive(), std::optional<std::string>("first"));
    EXPECT_EQ(channel_.receive(), std::optional<std::string>("second"));
    EXPECT_EQ(channel_.size(), 0u);
}

TEST_F(EventChannelTest, SendAfterCloseIsRefused) {
    channel_.close();

    EXPECT_TRUE(channel_.isClosed());
    EXPECT_FALSE(channel_.send("late"));
    EXPECT_EQ(channel_.size(), 0u);
    EXPECT_EQ(channel_.receive(), std::nullopt);
}

TEST_F(EventChannelTest, CloseDiscardsBufferedEvents) {
    channel_.send("pending");
    channel_.close();

    EXPECT_EQ(channel_.size(), 0u);
    EXPECT_EQ(channel_.receive(), std::nullopt);
}

TEST_F(EventChannelTest, CloseIsIdempotent) {
    channel_.close();
    channel_.close();
    EXPECT_TRUE(channel_.isClosed());
}

TEST_F(EventChannelTest, ReceiveBlocksUntilEventArrives) {
    std::atomic<bool> received{false};
    std::optional<std::string> value;

    std::thread receiver([this, &received, &value]() {
        value = channel_.receive();
        received = true;
    });

    std::this_thread::sleep_for(::AFSM::Test::Utils::STANDARD_WAIT_MS);
    EXPECT_FALSE(received.load());

    channel_.send("wake");
    receiver.join();

    EXPECT_TRUE(received.load());
    EXPECT_EQ(value, std::optional<std::string>("wake"));
}

TEST_F(EventChannelTest, CloseWakesBlockedReceiver) {
    std::optional<std::string> value = "unset";

    std::thread receiver([this, &value]() { value = channel_.receive(); });

    std::this_thread::sleep_for(::AFSM::Test::Utils::STANDARD_WAIT_MS);
    channel_.close();
    receiver.join();

    EXPECT_EQ(value, std::nullopt);
}

}  // namespace AFSM

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "fablecore/errors.hpp"
#include "fablecore/token_channel.hpp"

using namespace fablecore;
using namespace std::chrono_literals;

namespace {

std::chrono::steady_clock::time_point in(std::chrono::milliseconds delay) {
    return std::chrono::steady_clock::now() + delay;
}

} // anonymous namespace

// =============================================================================
// Ordering Tests
// =============================================================================

TEST(TokenChannelTest, QueuedTokens_ShouldBeDeliveredBeforeFinish) {
    TokenChannel channel(4);
    ASSERT_TRUE(channel.push("a"));
    ASSERT_TRUE(channel.push("b"));
    channel.finish();

    std::string token;
    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Token);
    EXPECT_EQ(token, "a");
    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Token);
    EXPECT_EQ(token, "b");
    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Finished);
}

TEST(TokenChannelTest, Fail_ShouldReportReasonAfterQueuedTokens) {
    TokenChannel channel(4);
    channel.push("partial");
    channel.fail("model offline");

    std::string token;
    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Token);
    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Failed);
    EXPECT_EQ(channel.failure().value_or(""), "model offline");
}

TEST(TokenChannelTest, PushAfterFinish_ShouldBeRefused) {
    TokenChannel channel(4);
    channel.finish();
    EXPECT_FALSE(channel.push("late"));
}

// =============================================================================
// Timing Tests
// =============================================================================

TEST(TokenChannelTest, EmptyChannel_ShouldTimeOutAtDeadline) {
    TokenChannel channel(4);
    std::string token;

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(channel.pop_until(token, in(30ms)), TokenChannel::PopStatus::TimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 25ms);
}

TEST(TokenChannelTest, FullChannel_ShouldBlockProducerUntilConsumed) {
    // Given a channel with room for one token, already full
    TokenChannel channel(1);
    ASSERT_TRUE(channel.push("first"));

    std::atomic<bool> second_pushed{false};
    std::thread producer([&] {
        channel.push("second");
        second_pushed = true;
    });

    // Then the producer waits
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(second_pushed.load());

    // Until the consumer takes a token
    std::string token;
    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Token);
    EXPECT_EQ(token, "first");
    producer.join();
    EXPECT_TRUE(second_pushed.load());

    EXPECT_EQ(channel.pop_until(token, in(100ms)), TokenChannel::PopStatus::Token);
    EXPECT_EQ(token, "second");
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST(TokenChannelTest, Cancel_ShouldReleaseBlockedProducer) {
    TokenChannel channel(1);
    ASSERT_TRUE(channel.push("first"));

    std::atomic<bool> push_result{true};
    std::thread producer([&] { push_result = channel.push("second"); });

    std::this_thread::sleep_for(20ms);
    channel.cancel();
    producer.join();

    EXPECT_FALSE(push_result.load());
    EXPECT_TRUE(channel.cancelled());

    std::string token;
    EXPECT_EQ(channel.pop_until(token, in(10ms)), TokenChannel::PopStatus::Cancelled);
}

TEST(TokenChannelTest, ZeroCapacity_ShouldThrowValidationError) {
    EXPECT_THROW(TokenChannel(0), ValidationError);
}

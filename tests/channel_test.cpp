#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "channel.h"

TEST(Channel, DeliversInOrderThenReportsClosed) {
    Channel<int> ch;
    ch.push(1);
    ch.push(2);
    ch.close();
    EXPECT_FALSE(ch.push(3));

    int v = 0;
    ASSERT_TRUE(ch.pop(v));
    EXPECT_EQ(v, 1);
    ASSERT_TRUE(ch.pop(v));
    EXPECT_EQ(v, 2);
    EXPECT_FALSE(ch.pop(v));
}

TEST(Channel, PopUntilTimesOutWhenIdle) {
    Channel<int> ch;
    int v = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(20);
    EXPECT_EQ(ch.pop_until(v, deadline), PopStatus::Timeout);
    ch.push(7);
    EXPECT_EQ(ch.pop_until(v, deadline), PopStatus::Item);
    EXPECT_EQ(v, 7);
    ch.close();
    EXPECT_EQ(ch.pop_until(v, std::chrono::steady_clock::now() + std::chrono::hours(1)),
              PopStatus::Closed);
}

TEST(Channel, WaitDrainedReturnsAfterConsumerFinishes) {
    Channel<std::string> ch;
    std::vector<std::string> seen;
    std::thread consumer([&] {
        std::string s;
        while (ch.pop(s)) {
            seen.push_back(s);
            ch.task_done();
        }
    });

    ch.push("a");
    ch.push("b");
    ch.push("c");
    ch.wait_drained();
    EXPECT_EQ(ch.size(), 0u);
    ch.close();
    consumer.join();
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Channel, DiscardDropsPendingAndReleasesDrainWaiters) {
    Channel<int> ch;
    ch.push(1);
    ch.push(2);
    ch.push(3);
    int v = 0;
    ASSERT_TRUE(ch.pop(v));
    const auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(10);
    EXPECT_FALSE(ch.wait_drained_until(soon));

    EXPECT_EQ(ch.discard(), 2u);
    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.pop(v));
    // The popped item is still in flight until task_done
    EXPECT_FALSE(ch.wait_drained_until(std::chrono::steady_clock::now()));
    ch.task_done();
    EXPECT_TRUE(ch.wait_drained_until(std::chrono::steady_clock::now() + std::chrono::seconds(1)));
}

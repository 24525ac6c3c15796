#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <strata/dispatcher.hpp>
#include <thread>
#include <vector>

using namespace strata;
using namespace std::chrono_literals;

TEST(SerialQueueTest, RunsPostedWorkInOrder)
{
    SerialQueue queue;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
        queue.post([&order, i] { order.push_back(i); });

    EXPECT_EQ(queue.pending(), 5u);
    EXPECT_EQ(queue.run_pending(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(SerialQueueTest, WorkPostedDuringRunIsRunToo)
{
    SerialQueue queue;
    std::vector<int> order;
    queue.post(
        [&]
        {
            order.push_back(1);
            queue.post([&] { order.push_back(2); });
        });
    EXPECT_EQ(queue.run_pending(), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(SerialQueueTest, DelayedWorkWaitsForItsTime)
{
    SerialQueue queue;
    bool ran = false;
    queue.post_after(100ms, [&] { ran = true; });

    EXPECT_EQ(queue.run_pending(), 0u);
    EXPECT_FALSE(ran);
    EXPECT_EQ(queue.pending(), 1u);

    EXPECT_TRUE(queue.run_until([&] { return ran; }, 2000ms));
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(SerialQueueTest, DelayedWorkOrderedByDueTime)
{
    SerialQueue queue;
    std::vector<int> order;
    queue.post_after(60ms, [&] { order.push_back(2); });
    queue.post_after(20ms, [&] { order.push_back(1); });
    queue.post([&] { order.push_back(0); });

    queue.run_for(200ms);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(SerialQueueTest, RunUntilTimesOut)
{
    SerialQueue queue;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.run_until([] { return false; }, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(SerialQueueTest, RunUntilStopsAsSoonAsPredicateHolds)
{
    SerialQueue queue;
    int count = 0;
    for (int i = 0; i < 3; ++i)
        queue.post([&] { ++count; });

    EXPECT_TRUE(queue.run_until([&] { return count == 1; }, 1000ms));
    EXPECT_EQ(count, 1);
    EXPECT_EQ(queue.pending(), 2u);
}

TEST(SerialQueueTest, CrossThreadPostWakesRunner)
{
    SerialQueue queue;
    std::atomic<bool> ran{false};
    std::thread poster(
        [&]
        {
            std::this_thread::sleep_for(30ms);
            queue.post([&] { ran = true; });
        });

    EXPECT_TRUE(queue.run_until([&] { return ran.load(); }, 2000ms));
    poster.join();
}

TEST(SerialQueueTest, RunForCountsItems)
{
    SerialQueue queue;
    queue.post([] {});
    queue.post_after(10ms, [] {});
    EXPECT_EQ(queue.run_for(100ms), 2u);
}

TEST(SerialQueueTest, ExceptionsPropagateToRunner)
{
    SerialQueue queue;
    queue.post([] { throw std::runtime_error("boom"); });
    queue.post([] {});
    EXPECT_THROW(queue.run_pending(), std::runtime_error);
    // Remaining work is still queued
    EXPECT_EQ(queue.run_pending(), 1u);
}

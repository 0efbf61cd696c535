#include "task_agg/join_counter.hpp"
#include "task_agg/thread_group.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace std::chrono_literals;

TEST(JoinCounter, ZeroDoesNotBlock) {
    task_agg::JoinCounter counter(0);
    EXPECT_TRUE(counter.WaitFor(0ms));
    counter.Wait();
}

TEST(JoinCounter, WaitsForEveryDone) {
    task_agg::JoinCounter counter(3);
    counter.Done();
    counter.Done();
    EXPECT_EQ(counter.Count(), 1u);
    EXPECT_FALSE(counter.WaitFor(20ms));

    auto waiter = std::async(std::launch::async, [&] { counter.Wait(); });
    EXPECT_EQ(waiter.wait_for(20ms), std::future_status::timeout);
    counter.Done();
    EXPECT_EQ(waiter.wait_for(500ms), std::future_status::ready);
}

TEST(JoinCounter, AddThenDone) {
    task_agg::JoinCounter counter;
    counter.Add(2);
    counter.Done(2);
    EXPECT_EQ(counter.Count(), 0u);
}

TEST(JoinCounter, NegativeIsLogicError) {
    task_agg::JoinCounter counter(1);
    counter.Done();
    EXPECT_THROW(counter.Done(), std::logic_error);
}

TEST(ThreadGroup, JoinsOnDestruction) {
    std::atomic<int> finished{0};
    {
        task_agg::ThreadGroup group;
        for (int i = 0; i < 8; ++i) {
            group.Spawn([&finished] {
                std::this_thread::sleep_for(5ms);
                finished.fetch_add(1, std::memory_order_relaxed);
            });
        }
        EXPECT_EQ(group.Size(), 8u);
    }
    EXPECT_EQ(finished.load(), 8);
}

TEST(ThreadGroup, SpawnJoinedSignalsCounter) {
    constexpr std::size_t N = 64;
    std::atomic<std::size_t> ran{0};
    task_agg::JoinCounter counter(N);
    {
        task_agg::ThreadGroup group;
        std::exception_ptr error;
        EXPECT_EQ(task_agg::SpawnJoined(group, counter, N, [&ran] {
            ran.fetch_add(1, std::memory_order_relaxed);
        }, error), N);
        EXPECT_FALSE(error);
        counter.Wait();
        // The wait completes only after every unit has run.
        EXPECT_EQ(ran.load(), N);
    }
    EXPECT_EQ(counter.Count(), 0u);
}

TEST(ThreadGroup, LimitFailsLikeTheOs) {
    task_agg::ThreadGroup group(2);
    group.Spawn([] {});
    group.Spawn([] {});
    try {
        group.Spawn([] {});
        ADD_FAILURE() << "spawn past the limit succeeded";
    } catch (const std::system_error& e) {
        EXPECT_TRUE(e.code() == std::errc::resource_unavailable_try_again);
    }
    EXPECT_EQ(group.Size(), 2u);
}

// A failed spawn credits the units that never started, so Wait() returns
TEST(ThreadGroup, SpawnJoinedCreditsUnstarted) {
    constexpr std::size_t N = 10;
    std::atomic<std::size_t> ran{0};
    task_agg::JoinCounter counter(N);
    {
        task_agg::ThreadGroup group(3);
        std::exception_ptr error;
        EXPECT_EQ(task_agg::SpawnJoined(group, counter, N, [&ran] {
            ran.fetch_add(1, std::memory_order_relaxed);
        }, error), 3u);
        ASSERT_TRUE(error);
        EXPECT_THROW(std::rethrow_exception(error), std::system_error);
        EXPECT_TRUE(counter.WaitFor(1000ms));
    }
    EXPECT_EQ(ran.load(), 3u);
}

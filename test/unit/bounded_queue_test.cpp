/*
Ring buffer (bounded queue) tests
*/

#include "mpmc/bounded_circular_queue.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

// Capacity is kept exactly, only raised to the minimum of 2
TEST(BoundedCircularQueueTest, Capacity) {
    BoundedCircularQueue<int> q100(100);
    EXPECT_EQ(q100.Capacity(), 100u);
    BoundedCircularQueue<int> q3(3);
    EXPECT_EQ(q3.Capacity(), 3u);
    BoundedCircularQueue<int> q1(1);
    EXPECT_EQ(q1.Capacity(), 2u);
    BoundedCircularQueue<int> q0(0);
    EXPECT_EQ(q0.Capacity(), 2u);
}

// A queue sized to N accepts exactly N pushes
TEST(BoundedCircularQueueTest, FillsToCapacity) {
    constexpr int N = 100;
    BoundedCircularQueue<int> queue(N);
    for (int i = 0; i < N; ++i) {
        EXPECT_TRUE(queue.TryPush(i));
    }
    EXPECT_TRUE(queue.Full());
    EXPECT_EQ(queue.ApproxSize(), static_cast<std::size_t>(N));
    EXPECT_FALSE(queue.TryPush(N));

    int item = -1;
    for (int i = 0; i < N; ++i) {
        ASSERT_TRUE(queue.TryPop(item));
        EXPECT_EQ(item, i);
    }
    EXPECT_TRUE(queue.Empty());
    EXPECT_FALSE(queue.TryPop(item));
}

// Wrap-around with a capacity that is not a power of two
TEST(BoundedCircularQueueTest, WrapAroundOddCapacity) {
    BoundedCircularQueue<int> queue(7);
    int item = -1;
    for (int i = 0; i < 50000; ++i) {
        ASSERT_TRUE(queue.TryPush(i));
        ASSERT_TRUE(queue.TryPush(i + 1));
        ASSERT_TRUE(queue.TryPop(item));
        EXPECT_EQ(item, i);
        ASSERT_TRUE(queue.TryPop(item));
        EXPECT_EQ(item, i + 1);
    }
    EXPECT_TRUE(queue.Empty());
}

// Every pushed value is popped exactly once across producers and consumers
TEST(BoundedCircularQueueTest, MultiThreadedExactlyOnce) {
    constexpr int N = 100000;
    constexpr int P = 4;
    constexpr int C = 3;

    BoundedCircularQueue<int> queue(97);
    std::atomic<int> next{0};
    std::atomic<int> consumed{0};
    std::vector<std::atomic<int>> seen(N);
    for (auto& s : seen) {
        s.store(0, std::memory_order_relaxed);
    }

    std::vector<std::thread> threads;
    for (int p = 0; p < P; ++p) {
        threads.emplace_back([&] {
            for (;;) {
                const int i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= N) {
                    break;
                }
                while (!queue.TryPush(i)) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (int c = 0; c < C; ++c) {
        threads.emplace_back([&] {
            int item = -1;
            while (consumed.load(std::memory_order_relaxed) < N) {
                if (queue.TryPop(item)) {
                    seen[item].fetch_add(1, std::memory_order_relaxed);
                    consumed.fetch_add(1, std::memory_order_relaxed);
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(consumed.load(), N);
    for (int i = 0; i < N; ++i) {
        ASSERT_EQ(seen[i].load(), 1) << "value " << i;
    }
}

struct Counted {
    static std::atomic<int> live;
    int v;
    explicit Counted(int x = 0) : v(x) {
        live.fetch_add(1, std::memory_order_relaxed);
    }
    Counted(const Counted& o) : v(o.v) {
        live.fetch_add(1, std::memory_order_relaxed);
    }
    Counted& operator=(const Counted& o) = default;
    ~Counted() {
        live.fetch_sub(1, std::memory_order_relaxed);
    }
};
std::atomic<int> Counted::live{0};

// Elements still queued at destruction are destroyed too
TEST(BoundedCircularQueueTest, DestroysLeftovers) {
    {
        BoundedCircularQueue<Counted> queue(16);
        for (int i = 0; i < 10; ++i) {
            EXPECT_TRUE(queue.TryPush(Counted{i}));
        }
        Counted out;
        EXPECT_TRUE(queue.TryPop(out));
        EXPECT_EQ(out.v, 0);
    }
    EXPECT_EQ(Counted::live.load(), 0);
}

// A failed push must not move from its argument
TEST(BoundedCircularQueueTest, NoConsumeOnFailure) {
    BoundedCircularQueue<std::unique_ptr<int>> queue(2);
    ASSERT_TRUE(queue.TryPush(std::make_unique<int>(1)));
    ASSERT_TRUE(queue.TryPush(std::make_unique<int>(2)));

    auto p = std::make_unique<int>(3);
    EXPECT_FALSE(queue.TryPush(std::move(p)));
    ASSERT_TRUE(p);
    EXPECT_EQ(*p, 3);
}

#include "../include/rlog/backend.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#if RLOG_HAS_THREAD
#include <thread>
#endif

using namespace std::chrono_literals;

TEST(LoggerBackend, PostAndDrain) {
    rlog::LoggerBackend backend;
    std::vector<std::string> ran;

    backend.Post([&] { ran.push_back("hello"); });
    backend.Post([&] { ran.push_back("world"); });

    size_t drained = backend.Drain();
    EXPECT_EQ(drained, 2u);
    ASSERT_EQ(ran.size(), 2u);
    EXPECT_EQ(ran[0], "hello");
    EXPECT_EQ(ran[1], "world");
}

TEST(LoggerBackend, DrainMaxTasks) {
    rlog::LoggerBackend backend;
    int count = 0;
    for (int i = 0; i < 100; ++i) {
        backend.Post([&] { ++count; });
    }

    size_t first_batch = backend.Drain(10);
    EXPECT_EQ(first_batch, 10u);
    EXPECT_EQ(count, 10);

    size_t rest = 0;
    size_t batch;
    while ((batch = backend.Drain(64)) > 0) {
        rest += batch;
    }
    EXPECT_EQ(rest, 90u);
    EXPECT_EQ(count, 100);
}

TEST(LoggerBackend, DrainEmpty) {
    rlog::LoggerBackend backend;
    EXPECT_EQ(backend.Drain(), 0u);
}

TEST(LoggerBackend, DelayedTaskWaitsForDeadline) {
    rlog::LoggerBackend backend;
    bool fired = false;
    backend.PostDelayed(50ms, [&] { fired = true; });

    EXPECT_EQ(backend.Drain(), 0u);
    EXPECT_FALSE(fired);
    EXPECT_EQ(backend.PendingTimers(), 1u);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!fired && std::chrono::steady_clock::now() < deadline) {
        backend.Drain();
    }
    EXPECT_TRUE(fired);
    EXPECT_EQ(backend.PendingTimers(), 0u);
}

TEST(LoggerBackend, ZeroDelayRunsOnNextDrain) {
    rlog::LoggerBackend backend;
    bool fired = false;
    backend.PostDelayed(0ms, [&] { fired = true; });
    EXPECT_EQ(backend.Drain(), 1u);
    EXPECT_TRUE(fired);
}

TEST(LoggerBackend, CancelTimer) {
    rlog::LoggerBackend backend;
    bool fired = false;
    auto id = backend.PostDelayed(0ms, [&] { fired = true; });
    EXPECT_NE(id, rlog::LoggerBackend::kNoTimer);

    EXPECT_TRUE(backend.Cancel(id));
    EXPECT_FALSE(backend.Cancel(id));
    backend.Drain();
    EXPECT_FALSE(fired);
}

TEST(LoggerBackend, TimerIdsAreUnique) {
    rlog::LoggerBackend backend;
    auto a = backend.PostDelayed(1h, [] {});
    auto b = backend.PostDelayed(1h, [] {});
    EXPECT_NE(a, b);
    EXPECT_EQ(backend.PendingTimers(), 2u);
}

TEST(LoggerBackend, DueTimersRunInDeadlineOrder) {
    rlog::LoggerBackend backend;
    std::vector<int> order;
    backend.PostDelayed(20ms, [&] { order.push_back(2); });
    backend.PostDelayed(10ms, [&] { order.push_back(1); });

#if RLOG_HAS_THREAD
    std::this_thread::sleep_for(40ms);
#endif
    backend.Drain();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
}

TEST(LoggerBackend, WaitIdleWithoutThreadDrains) {
    rlog::LoggerBackend backend;
    int count = 0;
    for (int i = 0; i < 200; ++i) {
        backend.Post([&] { ++count; });
    }
    backend.WaitIdle();
    EXPECT_EQ(count, 200);
}

TEST(LoggerBackend, TaskMayPostFollowUp) {
    rlog::LoggerBackend backend;
    std::vector<int> order;
    backend.Post([&] {
        order.push_back(1);
        backend.Post([&] { order.push_back(2); });
    });
    backend.WaitIdle();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[1], 2);
}

#if RLOG_HAS_THREAD
TEST(LoggerBackend, StartStopWithThread) {
    rlog::LoggerBackend backend;
    std::atomic<int> count{0};

    backend.Start();
    EXPECT_TRUE(backend.Running());

    for (int i = 0; i < 50; ++i) {
        backend.Post([&] { count.fetch_add(1, std::memory_order_relaxed); });
    }
    backend.WaitIdle();
    EXPECT_EQ(count.load(), 50);

    backend.Stop();
    EXPECT_FALSE(backend.Running());
}

TEST(LoggerBackend, WorkerFiresTimer) {
    rlog::LoggerBackend backend;
    std::atomic<bool> fired{false};
    backend.Start();
    backend.PostDelayed(20ms, [&] { fired.store(true); });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!fired.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(fired.load());
    backend.Stop();
}

TEST(LoggerBackend, StopRunsQueuedTasksAndDropsTimers) {
    rlog::LoggerBackend backend;
    std::atomic<bool> timer_fired{false};
    backend.PostDelayed(1h, [&] { timer_fired.store(true); });
    backend.Start();
    backend.Stop();

    EXPECT_FALSE(timer_fired.load());
    EXPECT_EQ(backend.PendingTimers(), 0u);

    bool ran = false;
    backend.Post([&] { ran = true; });
    backend.Stop();
    EXPECT_TRUE(ran);
}

TEST(LoggerBackend, PostFromManyThreads) {
    rlog::LoggerBackend backend;
    std::atomic<int> count{0};
    backend.Start();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                backend.Post([&] { count.fetch_add(1, std::memory_order_relaxed); });
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    backend.WaitIdle();
    EXPECT_EQ(count.load(), 1000);
    backend.Stop();
}
#endif

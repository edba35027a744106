#include "loop.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace beam;

TEST(LoopTest, RunPendingKeepsOrder) {
    Loop loop;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        loop.EnqueueTask([&order, i] { order.push_back(i); });
    }
    EXPECT_EQ(loop.RunPending(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(loop.RunPending(), 0u);
}

TEST(LoopTest, TasksQueuedWhileRunningWaitForNextBatch) {
    Loop loop;
    int runs = 0;
    loop.EnqueueTask([&] {
        ++runs;
        loop.EnqueueTask([&] { ++runs; });
    });
    EXPECT_EQ(loop.RunPending(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(loop.RunPending(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(LoopTest, CallReturnsResultFromLoopThread) {
    Loop loop;
    std::thread runner([&loop] { loop.Run(); });

    auto loopThread = loop.Call([] { return std::this_thread::get_id(); }).get();
    EXPECT_EQ(loopThread, runner.get_id());
    EXPECT_EQ(loop.Call([] { return 6 * 7; }).get(), 42);

    loop.Stop();
    runner.join();
}

TEST(LoopTest, CallPropagatesExceptions) {
    Loop loop;
    auto future = loop.Call([]() -> int { throw std::runtime_error("boom"); });
    loop.RunPending();
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(LoopTest, RunDrainsQueueBeforeStopping) {
    Loop loop;
    std::atomic<int> count{0};
    for (int i = 0; i < 100; ++i) {
        loop.EnqueueTask([&count] { ++count; });
    }
    loop.Stop();
    loop.Run();
    EXPECT_EQ(count.load(), 100);
}

TEST(LoopTest, TasksFromManyThreads) {
    Loop loop;
    std::thread runner([&loop] { loop.Run(); });

    std::atomic<int> count{0};
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                loop.EnqueueTask([&count] { ++count; });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    loop.Stop();
    runner.join();
    EXPECT_EQ(count.load(), 1000);
}

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../core/Executor.hpp"
#include "../debug/ManualExecutor.hpp"

using namespace arena::core;
using namespace std::chrono_literals;

TEST(ThreadExecutor, RunsTasksInOrder)
{
    ThreadExecutor exec;
    std::vector<int> order;
    std::promise<void> done;

    for (int i = 0; i < 100; ++i)
    {
        exec.Post([&order, i] { order.push_back(i); });
    }
    exec.Post([&done] { done.set_value(); });

    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    ASSERT_EQ(order.size(), 100u);
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }
}

TEST(ThreadExecutor, TimersFireByDeadline)
{
    ThreadExecutor exec;
    std::mutex m;
    std::vector<int> order;
    std::promise<void> done;

    exec.PostAfter(60ms, [&] { std::lock_guard<std::mutex> l(m); order.push_back(2); done.set_value(); });
    exec.PostAfter(20ms, [&] { std::lock_guard<std::mutex> l(m); order.push_back(1); });

    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    std::lock_guard<std::mutex> l(m);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(ThreadExecutor, CancelledTimerNeverRuns)
{
    ThreadExecutor exec;
    std::atomic<bool> fired{false};
    std::promise<void> done;

    TimerId const id = exec.PostAfter(30ms, [&fired] { fired = true; });
    EXPECT_TRUE(exec.Cancel(id));
    EXPECT_FALSE(exec.Cancel(id));

    exec.PostAfter(80ms, [&done] { done.set_value(); });
    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(fired.load());
}

TEST(ThreadExecutor, ThrowingTaskDoesNotStopTheLoop)
{
    ThreadExecutor exec;
    std::promise<void> done;

    exec.Post([] { throw std::runtime_error("boom"); });
    exec.Post([&done] { done.set_value(); });

    EXPECT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
}

TEST(ThreadExecutor, ShutdownDropsQueuedWork)
{
    ThreadExecutor exec;
    std::atomic<int> ran{0};

    exec.PostAfter(1h, [&ran] { ++ran; });
    exec.Shutdown();
    exec.Shutdown();
    exec.Post([&ran] { ++ran; });

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ran.load(), 0);
}

TEST(ThreadExecutor, TaskMayDestroyItsOwnExecutor)
{
    auto exec = std::make_unique<ThreadExecutor>();
    std::promise<void> gone;
    std::atomic<int> ran{0};

    exec->PostAfter(1h, [&ran] { ++ran; });
    exec->Post([&] {
        exec.reset();
        gone.set_value();
    });

    ASSERT_EQ(gone.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_EQ(exec, nullptr);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ran.load(), 0);
}

TEST(ThreadExecutor, ShutdownFromATaskStopsTheLoop)
{
    ThreadExecutor exec;
    std::promise<void> stopped;
    std::atomic<int> ran{0};

    exec.Post([&] {
        exec.Shutdown();
        stopped.set_value();
    });
    exec.Post([&ran] { ++ran; });

    ASSERT_EQ(stopped.get_future().wait_for(5s), std::future_status::ready);
    exec.Post([&ran] { ++ran; });
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ran.load(), 0);
}

TEST(ManualExecutor, VirtualClock)
{
    debug::ManualExecutor exec;
    std::vector<int> order;

    exec.PostAfter(100ms, [&] { order.push_back(2); });
    exec.PostAfter(100ms, [&] { order.push_back(3); });
    TimerId const never = exec.PostAfter(50ms, [&] { order.push_back(-1); });
    exec.Post([&] { order.push_back(1); });
    EXPECT_TRUE(exec.Cancel(never));

    exec.AdvanceBy(99ms);
    EXPECT_EQ(order, (std::vector<int>{1}));
    exec.AdvanceBy(1ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));

    // a timer scheduled from a timer lands relative to when it fired
    exec.PostAfter(10ms, [&] { exec.PostAfter(10ms, [&] { order.push_back(4); }); });
    EXPECT_EQ(exec.RunUntilIdle(), 20ms);
    EXPECT_EQ(order.back(), 4);
    EXPECT_EQ(exec.Now(), 120ms);
}

#include <gtest/gtest.h>

#include "core/frame_step.h"
#include "test_support.h"

#include <thread>
#include <vector>

using namespace drift;
using namespace std::chrono_literals;

TEST(EventLoop, PostedTasksRunOnlyInsideRunPending)
{
    test::ManualLoop m;
    int runs = 0;
    m.loop.Post([&]() { ++runs; });
    EXPECT_EQ(runs, 0);
    EXPECT_TRUE(m.loop.HasPostedTasks());

    EXPECT_EQ(m.loop.RunPending(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(m.loop.HasPostedTasks());
}

TEST(EventLoop, TaskPostedByTaskRunsInSameDrain)
{
    test::ManualLoop m;
    std::vector<int> order;
    m.loop.Post([&]() {
        order.push_back(1);
        m.loop.Post([&]() { order.push_back(2); });
    });
    m.loop.RunPending();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
}

TEST(EventLoop, AfterWaitsForDeadline)
{
    test::ManualLoop m;
    int fired = 0;
    m.loop.After(100ms, [&]() { ++fired; });

    m.now += 99ms;
    m.loop.RunPending();
    EXPECT_EQ(fired, 0);

    m.now += 1ms;
    m.loop.RunPending();
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(m.loop.PendingTimerCount(), 0u);

    m.now += 1s;
    m.loop.RunPending();
    EXPECT_EQ(fired, 1);
}

TEST(EventLoop, TimersFireInDeadlineOrder)
{
    test::ManualLoop m;
    std::vector<int> order;
    m.loop.After(300ms, [&]() { order.push_back(3); });
    m.loop.After(100ms, [&]() { order.push_back(1); });
    m.loop.After(200ms, [&]() { order.push_back(2); });

    m.now += 1s;
    m.loop.RunPending();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}

TEST(EventLoop, EveryRepeatsUntilCancelled)
{
    test::ManualLoop m;
    int ticks = 0;
    const EventLoop::TimerId id = m.loop.Every(100ms, [&]() { ++ticks; });

    m.Advance(350ms, 10ms);
    EXPECT_EQ(ticks, 3);

    EXPECT_TRUE(m.loop.Cancel(id));
    m.Advance(1s);
    EXPECT_EQ(ticks, 3);
    EXPECT_FALSE(m.loop.Cancel(id));
}

TEST(EventLoop, RepeatingTimerSkipsMissedTicks)
{
    test::ManualLoop m;
    int ticks = 0;
    m.loop.Every(100ms, [&]() { ++ticks; });

    // One long stall: a single catch-up tick, not three.
    m.now += 350ms;
    m.loop.RunPending();
    EXPECT_EQ(ticks, 1);

    m.now += 99ms;
    m.loop.RunPending();
    EXPECT_EQ(ticks, 1);
    m.now += 1ms;
    m.loop.RunPending();
    EXPECT_EQ(ticks, 2);
}

TEST(EventLoop, TimerCanCancelItself)
{
    test::ManualLoop m;
    int ticks = 0;
    EventLoop::TimerId id = 0;
    id = m.loop.Every(10ms, [&]() {
        ++ticks;
        m.loop.Cancel(id);
    });
    m.Advance(100ms, 10ms);
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(m.loop.PendingTimerCount(), 0u);
}

TEST(EventLoop, CancelUnknownTimerReturnsFalse)
{
    test::ManualLoop m;
    EXPECT_FALSE(m.loop.Cancel(12345));
}

TEST(EventLoop, PostIsSafeFromOtherThreads)
{
    test::ManualLoop m;
    int runs = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([&]() {
            for (int k = 0; k < 25; ++k)
                m.loop.Post([&]() { ++runs; });
        });
    }
    for (auto& t : threads)
        t.join();

    m.loop.RunPending();
    EXPECT_EQ(runs, 100);
}

TEST(EventLoop, DefaultClockIsSteadyClock)
{
    EventLoop loop;
    const auto before = EventLoop::Clock::now();
    const auto now = loop.Now();
    EXPECT_GE(now, before);
}

// ─── Frame step ─────────────────────────────────────────────────────────────

TEST(FrameStep, FirstFrameAndFrozenClockAreZero)
{
    EXPECT_DOUBLE_EQ(FrameStepSeconds(0, 5000), 0.0);
    EXPECT_DOUBLE_EQ(FrameStepSeconds(5000, 5000), 0.0);
    EXPECT_DOUBLE_EQ(FrameStepSeconds(5000, 4000), 0.0);
}

TEST(FrameStep, NormalFramesPassThrough)
{
    EXPECT_NEAR(FrameStepSeconds(1000, 1016), 0.016, 1e-9);
    EXPECT_NEAR(FrameStepSeconds(1000, 1050), 0.050, 1e-9);
}

TEST(FrameStep, StalledFrameIsCappedWellBelowFadeLength)
{
    // A 450 ms stall (blur plus upload of a 4K image) must not consume most
    // of the 600 ms crossfade in one step.
    const double dt = FrameStepSeconds(1000, 1450);
    EXPECT_DOUBLE_EQ(dt, kMaxFrameStepSeconds);
    EXPECT_LT(dt * 4, 0.6);
}

#include <gtest/gtest.h>

#include "rotation/rotation_scheduler.h"
#include "test_support.h"

#include <vector>

using namespace drift;
using namespace std::chrono_literals;

namespace
{
struct SchedulerFixture
{
    test::ManualLoop m;
    std::vector<SwapTrigger> calls;
    RotationScheduler scheduler{m.loop, [this](SwapTrigger t) { calls.push_back(t); }};
};
} // namespace

TEST(RotationScheduler, ZeroIntervalNeverTicks)
{
    SchedulerFixture f;
    f.scheduler.SetInterval(0);
    EXPECT_FALSE(f.scheduler.Active());
    f.m.Advance(2h, 1min);
    EXPECT_TRUE(f.calls.empty());
    EXPECT_EQ(f.m.loop.PendingTimerCount(), 0u);
}

TEST(RotationScheduler, TicksEveryInterval)
{
    SchedulerFixture f;
    f.scheduler.SetInterval(5);
    EXPECT_TRUE(f.scheduler.Active());
    EXPECT_EQ(f.scheduler.Interval(), 5u);

    f.m.Advance(4900ms, 100ms);
    EXPECT_TRUE(f.calls.empty());
    f.m.Advance(100ms, 100ms);
    ASSERT_EQ(f.calls.size(), 1u);
    EXPECT_EQ(f.calls[0], SwapTrigger::Timer);

    f.m.Advance(10s, 100ms);
    EXPECT_EQ(f.calls.size(), 3u);
}

TEST(RotationScheduler, SetIntervalReplacesTheTimer)
{
    SchedulerFixture f;
    f.scheduler.SetInterval(5);
    f.m.Advance(3s);
    f.scheduler.SetInterval(10);
    EXPECT_EQ(f.m.loop.PendingTimerCount(), 1u);

    f.m.Advance(9900ms, 100ms);
    EXPECT_TRUE(f.calls.empty());
    f.m.Advance(100ms, 100ms);
    EXPECT_EQ(f.calls.size(), 1u);
}

TEST(RotationScheduler, SettingZeroDisablesRunningTimer)
{
    SchedulerFixture f;
    f.scheduler.SetInterval(1);
    f.m.Advance(1s);
    ASSERT_EQ(f.calls.size(), 1u);

    f.scheduler.SetInterval(0);
    f.m.Advance(1h, 1s);
    EXPECT_EQ(f.calls.size(), 1u);
}

TEST(RotationScheduler, TriggerNowIsManual)
{
    SchedulerFixture f;
    f.scheduler.TriggerNow();
    ASSERT_EQ(f.calls.size(), 1u);
    EXPECT_EQ(f.calls[0], SwapTrigger::Manual);
}

TEST(RotationScheduler, DestructionClearsTimer)
{
    test::ManualLoop m;
    int calls = 0;
    {
        RotationScheduler s(m.loop, [&](SwapTrigger) { ++calls; });
        s.SetInterval(1);
        EXPECT_EQ(m.loop.PendingTimerCount(), 1u);
    }
    EXPECT_EQ(m.loop.PendingTimerCount(), 0u);
    m.Advance(5s);
    EXPECT_EQ(calls, 0);
}

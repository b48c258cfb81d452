#include "core/event_loop.h"

#include <utility>

namespace drift
{
namespace
{
// Guards against a task that keeps re-posting itself starving the frame.
static constexpr int kMaxRounds = 64;
} // namespace

EventLoop::EventLoop(NowFn now)
    : m_now(std::move(now))
{
    if (!m_now)
        m_now = []() { return Clock::now(); };
}

EventLoop::TimePoint EventLoop::Now() const
{
    return m_now();
}

void EventLoop::Post(Task task)
{
    if (!task)
        return;
    std::lock_guard<std::mutex> lock(m_mu);
    m_posted.push_back(std::move(task));
}

bool EventLoop::HasPostedTasks() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return !m_posted.empty();
}

EventLoop::TimerId EventLoop::After(Duration delay, Task task)
{
    if (delay.count() < 0)
        delay = Duration(0);
    const TimerId id = m_next_id++;
    m_timers[id] = Timer{Now() + delay, Duration(0), std::move(task)};
    return id;
}

EventLoop::TimerId EventLoop::Every(Duration period, Task task)
{
    if (period.count() <= 0)
        period = Duration(1);
    const TimerId id = m_next_id++;
    m_timers[id] = Timer{Now() + period, period, std::move(task)};
    return id;
}

bool EventLoop::Cancel(TimerId id)
{
    return m_timers.erase(id) > 0;
}

std::size_t EventLoop::RunPosted()
{
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        batch.swap(m_posted);
    }
    for (Task& t : batch)
        t();
    return batch.size();
}

bool EventLoop::RunNextDueTimer(TimePoint now)
{
    auto due = m_timers.end();
    for (auto it = m_timers.begin(); it != m_timers.end(); ++it)
    {
        if (it->second.deadline > now)
            continue;
        if (due == m_timers.end() || it->second.deadline < due->second.deadline)
            due = it;
    }
    if (due == m_timers.end())
        return false;

    const TimerId id = due->first;
    Timer& timer = due->second;

    // Copy the task: it may cancel or reschedule its own timer while running.
    Task task = timer.task;
    if (timer.period.count() > 0)
    {
        timer.deadline += timer.period;
        // Fell behind (e.g. a long stall): skip missed ticks instead of bursting.
        if (timer.deadline <= now)
            timer.deadline = now + timer.period;
    }
    else
    {
        m_timers.erase(id);
    }

    if (task)
        task();
    return true;
}

std::size_t EventLoop::RunPending()
{
    std::size_t ran = 0;
    for (int round = 0; round < kMaxRounds; ++round)
    {
        std::size_t ran_this_round = RunPosted();

        // Timers whose deadline passed before this round started; repeating timers
        // re-armed during the round land in the future and wait for the next call.
        const TimePoint now = Now();
        while (RunNextDueTimer(now))
            ++ran_this_round;

        ran += ran_this_round;
        if (ran_this_round == 0 && !HasPostedTasks())
            break;
    }
    return ran;
}
} // namespace drift

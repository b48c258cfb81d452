#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace drift
{
// Single logical thread of control for the rotation engine.
//
// - Post() is the only thread-safe entry point; worker threads use it to hand
//   completions back to the loop thread.
// - Timers (After/Every) and posted tasks only ever run inside RunPending(),
//   which the host calls once per frame.
class EventLoop
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using NowFn = std::function<TimePoint()>;

    // `now` defaults to steady_clock::now. Tests inject a manual clock.
    explicit EventLoop(NowFn now = {});

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    TimePoint Now() const;

    void Post(Task task);

    TimerId After(Duration delay, Task task);
    TimerId Every(Duration period, Task task);

    // Returns false if the timer already fired (one-shot) or was never scheduled.
    bool Cancel(TimerId id);

    // Runs posted tasks, then every timer whose deadline has passed.
    // Work queued by those tasks runs in the same call as long as it is ready.
    std::size_t RunPending();

    std::size_t PendingTimerCount() const { return m_timers.size(); }
    bool HasPostedTasks() const;

private:
    struct Timer
    {
        TimePoint deadline{};
        Duration period{0}; // zero for one-shot
        Task task;
    };

    std::size_t RunPosted();
    bool RunNextDueTimer(TimePoint now);

    NowFn m_now;

    mutable std::mutex m_mu;
    std::vector<Task> m_posted; // guarded by m_mu

    std::map<TimerId, Timer> m_timers;
    TimerId m_next_id = 1;
};
} // namespace drift

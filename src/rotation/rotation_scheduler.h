#pragma once

#include "core/event_loop.h"
#include "rotation/rotation_state.h"

#include <functional>

namespace drift
{
// Single repeating timer that issues swap requests every `interval` seconds.
// Ticks and manual "next image" requests go through the same sink, so they are
// subject to the same single-flight / coalescing rule.
class RotationScheduler
{
public:
    using SwapSink = std::function<void(SwapTrigger)>;

    RotationScheduler(EventLoop& loop, SwapSink sink);
    ~RotationScheduler();

    RotationScheduler(const RotationScheduler&) = delete;
    RotationScheduler& operator=(const RotationScheduler&) = delete;

    // Replaces the timer. 0 disables automatic rotation.
    void SetInterval(unsigned seconds);
    unsigned Interval() const { return m_interval_s; }
    bool Active() const { return m_timer != 0; }

    void TriggerNow();

    void Stop();

private:
    EventLoop& m_loop;
    SwapSink m_sink;
    unsigned m_interval_s = 0;
    EventLoop::TimerId m_timer = 0;
};
} // namespace drift

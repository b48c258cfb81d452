#include "rotation/rotation_scheduler.h"

#include <chrono>
#include <utility>

namespace drift
{
RotationScheduler::RotationScheduler(EventLoop& loop, SwapSink sink)
    : m_loop(loop)
    , m_sink(std::move(sink))
{
}

RotationScheduler::~RotationScheduler()
{
    Stop();
}

void RotationScheduler::SetInterval(unsigned seconds)
{
    Stop();
    m_interval_s = seconds;
    if (seconds == 0)
        return;

    m_timer = m_loop.Every(std::chrono::seconds(seconds), [this]() {
        if (m_sink)
            m_sink(SwapTrigger::Timer);
    });
}

void RotationScheduler::TriggerNow()
{
    if (m_sink)
        m_sink(SwapTrigger::Manual);
}

void RotationScheduler::Stop()
{
    if (m_timer != 0)
    {
        m_loop.Cancel(m_timer);
        m_timer = 0;
    }
}
} // namespace drift

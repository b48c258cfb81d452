#include "rotation/transition_coordinator.h"

#include "rotation/double_buffer.h"
#include "rotation/preload_cache.h"
#include "rotation/render_outputs.h"
#include "rotation/retry_fallback_resolver.h"

#include <cstdio>
#include <exception>
#include <utility>

namespace drift
{
namespace
{
static const char* TriggerName(SwapTrigger t)
{
    switch (t)
    {
        case SwapTrigger::Mount: return "mount";
        case SwapTrigger::Timer: return "timer";
        case SwapTrigger::Manual: return "manual";
        default: return "?";
    }
}
} // namespace

TransitionCoordinator::TransitionCoordinator(EventLoop& loop,
                                             RotationState& state,
                                             DoubleBuffer& buffer,
                                             PreloadCache& preload,
                                             RetryFallbackResolver& resolver,
                                             RenderOutputs& outputs,
                                             ToneAnalyzer analyzer)
    : m_loop(loop)
    , m_state(state)
    , m_buffer(buffer)
    , m_preload(preload)
    , m_resolver(resolver)
    , m_outputs(outputs)
    , m_analyzer(analyzer)
{
}

TransitionCoordinator::~TransitionCoordinator()
{
    *m_alive = false;
    if (m_safety_timer != 0)
        m_loop.Cancel(m_safety_timer);
}

void TransitionCoordinator::RequestSwap(SwapTrigger trigger)
{
    if (m_state.switching)
    {
        if (!m_state.queued.Offer(trigger))
            ++m_coalesced;
        return;
    }

    try
    {
        BeginSwap(trigger);
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "[transition] swap aborted: %s\n", e.what());
        ResetToIdle();
    }
}

void TransitionCoordinator::BeginSwap(SwapTrigger trigger)
{
    m_state.switching = true;
    const std::uint64_t id = m_next_id++;
    m_active_id = id;
    ++m_started;

    std::optional<LoadResult> cached = m_preload.Take();
    if (cached)
    {
        StartCrossfade(id, std::move(*cached));
        return;
    }

    std::fprintf(stderr, "[transition] #%llu (%s): no preloaded image, resolving\n",
                 (unsigned long long)id, TriggerName(trigger));

    std::shared_ptr<bool> alive = m_alive;
    m_resolver.LoadNextWithRetry([this, alive, id](LoadOutcome outcome) {
        if (!*alive)
            return;
        try
        {
            OnResolved(id, std::move(outcome));
        }
        catch (const std::exception& e)
        {
            std::fprintf(stderr, "[transition] swap aborted: %s\n", e.what());
            if (m_active_id == id)
                ResetToIdle();
        }
    });
}

void TransitionCoordinator::OnResolved(std::uint64_t id, LoadOutcome outcome)
{
    if (id != m_active_id || !m_state.switching)
        return;

    if (outcome.ok)
    {
        StartCrossfade(id, std::move(outcome.result));
        return;
    }

    std::fprintf(stderr, "[transition] #%llu: %s after %d attempts (%s), showing fallback\n",
                 (unsigned long long)id, LoadErrorName(outcome.error), outcome.attempts, outcome.message.c_str());

    // A request that queued behind a failed resolve is dropped; rotation
    // resumes on the next scheduler tick.
    ResetToIdle();
    ShowFallbackWithoutCrossfade(id);
    m_preload.Refill();
}

void TransitionCoordinator::ShowFallbackWithoutCrossfade(std::uint64_t id)
{
    ++m_fallback_displays;
    std::shared_ptr<bool> alive = m_alive;
    m_resolver.LoadFallback([this, alive, id](LoadOutcome outcome) {
        if (!*alive)
            return;
        // A newer transition owns the buffers now.
        if (m_state.switching || !IsLatest(id))
            return;
        if (!outcome.ok)
        {
            std::fprintf(stderr, "[transition] fallback asset unavailable: %s\n", outcome.message.c_str());
            return;
        }
        m_buffer.ShowOnPrimary(std::move(outcome.result));
    });
}

void TransitionCoordinator::StartCrossfade(std::uint64_t id, LoadResult result)
{
    const ToneClass tone = m_analyzer.Classify(result.bitmap);
    if (tone != ToneClass::Unknown)
    {
        m_state.tone = tone;
        m_outputs.ApplyTone(tone);
    }
    else
    {
        std::fprintf(stderr, "[transition] tone analysis failed for %s, keeping %s\n",
                     result.source_url.c_str(), ToneClassName(m_state.tone));
    }

    m_buffer.AssignHidden(std::move(result));
    m_buffer.FlushLayout();

    // Whichever fires first completes the transition; the other sees a stale id.
    std::shared_ptr<bool> alive = m_alive;
    m_safety_timer = m_loop.After(kSafetyNetTimeout, [this, alive, id]() {
        if (*alive)
            Complete(id, true);
    });
    m_buffer.BeginCrossfade([this, alive, id]() {
        if (*alive)
            Complete(id, false);
    });
}

void TransitionCoordinator::Complete(std::uint64_t id, bool timed_out)
{
    if (id != m_active_id || !m_state.switching)
        return;

    if (m_safety_timer != 0)
    {
        m_loop.Cancel(m_safety_timer);
        m_safety_timer = 0;
    }

    m_buffer.SwapRoles();
    m_preload.Clear();
    m_state.switching = false;
    m_active_id = 0;
    ++m_completed;

    if (timed_out)
        std::fprintf(stderr, "[transition] #%llu completed by safety net\n", (unsigned long long)id);

    std::optional<SwapTrigger> queued = m_state.queued.Take();
    if (queued)
        RequestSwap(*queued);

    m_preload.Refill();
}

void TransitionCoordinator::ResetToIdle()
{
    if (m_safety_timer != 0)
    {
        m_loop.Cancel(m_safety_timer);
        m_safety_timer = 0;
    }
    m_state.queued.Clear();
    m_state.switching = false;
    m_active_id = 0;
}
} // namespace drift

#pragma once

#include "core/event_loop.h"
#include "rotation/rotation_state.h"
#include "rotation/tone_analyzer.h"

#include <cstdint>
#include <memory>

namespace drift
{
class DoubleBuffer;
class PreloadCache;
class RenderOutputs;
class RetryFallbackResolver;

// Serializes swap requests and drives the crossfade.
//
//   Idle --RequestSwap--> Switching --crossfade end | safety net--> Idle
//                           |  ^
//          RequestSwap      |  | (queued flag, capacity 1)
//                           v  |
//                     Switching+Queued
//
// While Switching, further requests land in RotationState::queued; any number
// of them collapses into one deferred swap that starts as soon as the current
// transition completes. Both buffer slots are owned by this class.
class TransitionCoordinator
{
public:
    // Fade duration of each surface during the cross-dissolve.
    static constexpr EventLoop::Duration kCrossfadeDuration{600};
    // Completes a transition whose end event never arrives (minimized window).
    static constexpr EventLoop::Duration kSafetyNetTimeout{750};

    TransitionCoordinator(EventLoop& loop,
                          RotationState& state,
                          DoubleBuffer& buffer,
                          PreloadCache& preload,
                          RetryFallbackResolver& resolver,
                          RenderOutputs& outputs,
                          ToneAnalyzer analyzer = ToneAnalyzer());
    ~TransitionCoordinator();

    TransitionCoordinator(const TransitionCoordinator&) = delete;
    TransitionCoordinator& operator=(const TransitionCoordinator&) = delete;

    // Never throws. Returns immediately; the swap completes on the event loop.
    void RequestSwap(SwapTrigger trigger = SwapTrigger::Manual);

    bool Switching() const { return m_state.switching; }

    // Counters, mostly for tests and the debug overlay.
    std::uint64_t StartedTransitions() const { return m_started; }
    std::uint64_t CompletedTransitions() const { return m_completed; }
    std::uint64_t FallbackDisplays() const { return m_fallback_displays; }
    std::uint64_t CoalescedRequests() const { return m_coalesced; }

private:
    void BeginSwap(SwapTrigger trigger);
    void OnResolved(std::uint64_t id, LoadOutcome outcome);
    void StartCrossfade(std::uint64_t id, LoadResult result);
    void ShowFallbackWithoutCrossfade(std::uint64_t id);
    void Complete(std::uint64_t id, bool timed_out);
    bool IsLatest(std::uint64_t id) const { return id + 1 == m_next_id; }
    void ResetToIdle();

    EventLoop& m_loop;
    RotationState& m_state;
    DoubleBuffer& m_buffer;
    PreloadCache& m_preload;
    RetryFallbackResolver& m_resolver;
    RenderOutputs& m_outputs;
    ToneAnalyzer m_analyzer;

    // Id of the transition currently in Switching (0 when idle). Completions
    // and resolves carrying any other id are stale and ignored.
    std::uint64_t m_active_id = 0;
    std::uint64_t m_next_id = 1;
    EventLoop::TimerId m_safety_timer = 0;

    std::uint64_t m_started = 0;
    std::uint64_t m_completed = 0;
    std::uint64_t m_fallback_displays = 0;
    std::uint64_t m_coalesced = 0;

    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};
} // namespace drift

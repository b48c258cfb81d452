#pragma once

#include "rotation/coalescing_slot.h"
#include "rotation/rotation_types.h"

#include <optional>

namespace drift
{
// Where a swap request came from. Carried through the coalescing slot so the
// deferred swap reports the most recent trigger.
enum class SwapTrigger
{
    Mount,
    Timer,
    Manual,
};

// Process-wide state of one mounted rotation engine.
//
// Field ownership:
// - interval_seconds / blur_pixels: ConfigStore
// - switching / queued / preloaded / tone: TransitionCoordinator (preloaded is
//   refilled through PreloadCache on the coordinator's behalf)
//
// Invariants: !switching implies !queued.HasPending(); preloaded is cleared
// synchronously whenever it is consumed.
struct RotationState
{
    unsigned interval_seconds = 60;
    unsigned blur_pixels = 0;

    bool switching = false;
    CoalescingSlot<SwapTrigger> queued;

    std::optional<LoadResult> preloaded;
    ToneClass tone = ToneClass::Unknown;
};
} // namespace drift

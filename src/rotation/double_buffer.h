#pragma once

#include "rotation/rotation_types.h"

#include <functional>
#include <string>

namespace drift
{
// A render surface that can hold one bitmap and fade between hidden and visible.
// Implemented by the host (GPU texture quads) and by fakes in tests.
class RenderSurface
{
public:
    virtual ~RenderSurface() = default;

    // Replaces the surface content. Ownership of the pixels moves to the surface.
    virtual void SetBitmap(Bitmap bitmap) = 0;

    // Starts a fade to `visible`. `on_end` is the end-of-transition event and may
    // never fire (e.g. the window is minimized); it is always invoked on the
    // EventLoop thread when it does.
    virtual void FadeTo(bool visible, std::function<void()> on_end) = 0;

    // Jumps to `visible` with no animation; no end event.
    virtual void SetVisibleImmediate(bool visible) = 0;

    // Commits pending content/opacity so the next FadeTo animates from it.
    virtual void FlushLayout() = 0;
};

enum class SlotRole
{
    Primary,
    Secondary,
};

struct BufferSlot
{
    SlotRole role = SlotRole::Secondary;
    std::string current_url; // empty until the slot shows an image
    bool visible = false;    // tracks the fade, not the role
};

// Two render surfaces whose roles swap on each completed transition.
// Exactly one slot is primary at any time.
class DoubleBuffer
{
public:
    DoubleBuffer(RenderSurface& a, RenderSurface& b);

    int PrimaryIndex() const { return m_primary; }
    int SecondaryIndex() const { return 1 - m_primary; }

    const BufferSlot& Slot(int index) const { return m_slots[index]; }
    const BufferSlot& Primary() const { return m_slots[m_primary]; }
    const BufferSlot& Secondary() const { return m_slots[1 - m_primary]; }

    // Loads `result` into the hidden (secondary) surface.
    void AssignHidden(LoadResult result);

    // Puts `result` straight onto the primary surface without a crossfade.
    void ShowOnPrimary(LoadResult result);

    void FlushLayout();

    // Simultaneous cross-dissolve: primary fades out while secondary fades in.
    // `on_end` is wired to the fade-in surface's end event.
    void BeginCrossfade(std::function<void()> on_end);

    // Completes a transition: the (now visible) secondary becomes primary.
    void SwapRoles();

private:
    RenderSurface* m_surfaces[2];
    BufferSlot m_slots[2];
    int m_primary = 0;
};
} // namespace drift

#pragma once

#include "rotation/rotation_types.h"

#include <cstdint>

namespace drift
{
// Overlay intensity tokens keyed by tone.
struct OverlayTokens
{
    float scrim_alpha = 0.20f;
    float panel_alpha = 0.70f;
    float shadow_alpha = 0.40f;
};

OverlayTokens OverlayTokensFor(ToneClass tone);

// Render-facing outputs of the engine: the tone attribute consumed by theme
// styling, the overlay tokens and the blur radius. The host polls Revision()
// once per frame and re-reads the values when it moved.
class RenderOutputs
{
public:
    void ApplyTone(ToneClass tone);
    void SetBlurPixels(unsigned px);

    ToneClass Tone() const { return m_tone; }

    // "light", "dark", or "" before the first classification.
    const char* ToneAttribute() const;

    const OverlayTokens& Overlay() const { return m_overlay; }
    unsigned BlurPixels() const { return m_blur_px; }

    std::uint64_t Revision() const { return m_revision; }

private:
    ToneClass m_tone = ToneClass::Unknown;
    OverlayTokens m_overlay = OverlayTokensFor(ToneClass::Unknown);
    unsigned m_blur_px = 0;
    std::uint64_t m_revision = 0;
};
} // namespace drift

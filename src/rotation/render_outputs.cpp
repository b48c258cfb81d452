#include "rotation/render_outputs.h"

namespace drift
{
OverlayTokens OverlayTokensFor(ToneClass tone)
{
    OverlayTokens t;
    switch (tone)
    {
        case ToneClass::Light:
            // Bright images need a heavier scrim for the foreground to read.
            t.scrim_alpha = 0.35f;
            t.panel_alpha = 0.78f;
            t.shadow_alpha = 0.55f;
            break;
        case ToneClass::Dark:
            t.scrim_alpha = 0.12f;
            t.panel_alpha = 0.62f;
            t.shadow_alpha = 0.25f;
            break;
        case ToneClass::Unknown:
        default:
            break;
    }
    return t;
}

void RenderOutputs::ApplyTone(ToneClass tone)
{
    if (tone == m_tone)
        return;
    m_tone = tone;
    m_overlay = OverlayTokensFor(tone);
    ++m_revision;
}

void RenderOutputs::SetBlurPixels(unsigned px)
{
    if (px == m_blur_px)
        return;
    m_blur_px = px;
    ++m_revision;
}

const char* RenderOutputs::ToneAttribute() const
{
    if (m_tone == ToneClass::Unknown)
        return "";
    return ToneClassName(m_tone);
}
} // namespace drift

#pragma once

namespace drift
{
class RotationEngine;
}

namespace drift::ui
{
// Floating control panel bound to the engine's external interface:
// "Next image" -> RequestSwap, interval/blur selectors -> SetInterval/SetBlur.
// `text_shadow_alpha` comes from the overlay tokens.
void RenderRotationControls(RotationEngine& engine, float text_shadow_alpha, bool* open);

// "Off", "15 s", "1 min", "5 min", ...
const char* IntervalLabel(unsigned seconds);
} // namespace drift::ui

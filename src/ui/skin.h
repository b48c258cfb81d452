#pragma once

#include "rotation/render_outputs.h"

namespace drift::ui
{
// Panel themes keyed by the backdrop tone attribute.
inline constexpr const char* kThemeLight = "light";
inline constexpr const char* kThemeDark = "dark";

// Maps the tone attribute ("light", "dark", "") to a theme id. An empty
// attribute (no classification yet) uses the dark theme.
const char* ThemeIdForTone(const char* tone_attribute);

// Applies the theme to ImGui::GetStyle(), sets the window background alpha from
// the overlay panel token, then scales style sizes for HiDPI.
void ApplyBackdropTheme(const char* tone_attribute, const OverlayTokens& tokens, float ui_scale);
} // namespace drift::ui

#pragma once

#include <string>

namespace drift
{
// Returns the per-user config directory used by drift.
//
// "$XDG_CONFIG_HOME/drift", else "$HOME/.config/drift", else ".".
std::string GetDriftConfigDir();

// Returns the directory holding bundled assets (the local fallback backdrop).
//
// "$DRIFT_ASSETS_DIR" when set, otherwise the directory the build baked in
// (DRIFT_DEFAULT_ASSETS_DIR), otherwise "<config_dir>/assets".
std::string GetDriftAssetsDir();

// Joins the assets dir and a relative path within it.
// Example: DriftAssetPath("fallback.ppm") -> "<assets_dir>/fallback.ppm"
std::string DriftAssetPath(const std::string& relative);

// Path of the persisted settings file: "<config_dir>/settings.json".
std::string GetSettingsPath();
} // namespace drift

#pragma once

#include "core/bitmap.h"

#include <string>

namespace drift
{
enum class ToneClass
{
    Unknown = 0, // transient default before the first successful classification
    Light,
    Dark,
};

const char* ToneClassName(ToneClass tone); // "light" | "dark" | "unknown"

enum class LoadError
{
    None = 0,
    NetworkError,          // transport failure, non-2xx, unreadable local file
    DecodeError,           // bytes arrived but are not a decodable image
    AllProvidersExhausted, // every provider and the local fallback failed
};

const char* LoadErrorName(LoadError e);

// A decoded image plus where it came from. Moved, never copied, from the loader
// through the coordinator into the hidden buffer slot.
struct LoadResult
{
    Bitmap bitmap;
    std::string source_url;
};

// Outcome of a single fetch-and-decode, or of a whole retry/fallback chain.
struct LoadOutcome
{
    bool ok = false;
    LoadResult result;
    LoadError error = LoadError::None;
    std::string message;

    int attempts = 0;           // load operations spent (resolver outcomes only)
    bool used_fallback = false; // the bundled local asset was tried (resolver outcomes only)
};

// Device-class hint supplied by the host. The engine never detects the device itself.
enum class DeviceClass
{
    Compact = 0,
    Medium,
    Large,
};

struct DeviceHint
{
    DeviceClass device_class = DeviceClass::Large;
    bool high_density = false;

    // Requested image size = viewport * quality_scale (capped, see RequestSizeFor).
    float quality_scale = 1.0f;

    int max_grid_side = 32; // tone analysis grid
    int max_blur_px = 24;
    int max_interval_s = 3600;

    static DeviceHint ForClass(DeviceClass cls, bool high_density);
};

// Host-side classification of a display: short side < 600 px is compact,
// < 1100 px medium, otherwise large; content scale >= 2 is high density.
DeviceHint DeviceHintForDisplay(int usable_w, int usable_h, float content_scale);

struct ImageSize
{
    int width = 0;
    int height = 0;
};

// Viewport scaled by the hint's quality factor and capped to 3840x2160 (aspect kept).
ImageSize RequestSizeFor(int viewport_w, int viewport_h, const DeviceHint& hint);
} // namespace drift

#include "rotation/rotation_types.h"

#include <algorithm>
#include <cmath>

namespace drift
{
namespace
{
static constexpr int kMaxRequestW = 3840;
static constexpr int kMaxRequestH = 2160;
} // namespace

const char* ToneClassName(ToneClass tone)
{
    switch (tone)
    {
        case ToneClass::Light: return "light";
        case ToneClass::Dark: return "dark";
        case ToneClass::Unknown:
        default: return "unknown";
    }
}

const char* LoadErrorName(LoadError e)
{
    switch (e)
    {
        case LoadError::None: return "none";
        case LoadError::NetworkError: return "network";
        case LoadError::DecodeError: return "decode";
        case LoadError::AllProvidersExhausted: return "exhausted";
        default: return "unknown";
    }
}

DeviceHint DeviceHint::ForClass(DeviceClass cls, bool high_density)
{
    DeviceHint h;
    h.device_class = cls;
    h.high_density = high_density;
    switch (cls)
    {
        case DeviceClass::Compact:
            h.quality_scale = high_density ? 1.5f : 1.0f;
            h.max_grid_side = 16;
            h.max_blur_px = 8;
            break;
        case DeviceClass::Medium:
            h.quality_scale = high_density ? 1.5f : 1.0f;
            h.max_grid_side = 32;
            h.max_blur_px = 16;
            break;
        case DeviceClass::Large:
        default:
            h.quality_scale = high_density ? 2.0f : 1.0f;
            h.max_grid_side = 32;
            h.max_blur_px = 24;
            break;
    }
    h.max_interval_s = 3600;
    return h;
}

DeviceHint DeviceHintForDisplay(int usable_w, int usable_h, float content_scale)
{
    const int short_side = std::min(usable_w, usable_h);
    DeviceClass cls = DeviceClass::Large;
    if (short_side < 600)
        cls = DeviceClass::Compact;
    else if (short_side < 1100)
        cls = DeviceClass::Medium;
    return DeviceHint::ForClass(cls, content_scale >= 2.0f);
}

ImageSize RequestSizeFor(int viewport_w, int viewport_h, const DeviceHint& hint)
{
    const float scale = hint.quality_scale > 0.0f ? hint.quality_scale : 1.0f;
    double w = std::max(1, viewport_w) * (double)scale;
    double h = std::max(1, viewport_h) * (double)scale;

    const double fit = std::min({1.0, kMaxRequestW / w, kMaxRequestH / h});
    w *= fit;
    h *= fit;

    ImageSize out;
    out.width = std::max(1, (int)std::lround(w));
    out.height = std::max(1, (int)std::lround(h));
    return out;
}
} // namespace drift

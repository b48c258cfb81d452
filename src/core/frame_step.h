#pragma once

#include <cstdint>

namespace drift
{
// Longest step handed to per-frame animations.
constexpr double kMaxFrameStepSeconds = 0.1;

// Seconds elapsed between two SDL tick readings for animation purposes.
// 0 before the first reading and when the clock did not advance.
inline double FrameStepSeconds(std::uint64_t prev_ms, std::uint64_t now_ms)
{
    if (prev_ms == 0 || now_ms <= prev_ms)
        return 0.0;
    const double dt = (double)(now_ms - prev_ms) / 1000.0;
    return dt < kMaxFrameStepSeconds ? dt : kMaxFrameStepSeconds;
}
} // namespace drift

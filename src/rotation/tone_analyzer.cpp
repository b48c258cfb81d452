#include "rotation/tone_analyzer.h"

#include "core/bitmap.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace drift
{
namespace
{
// 8-bit channel -> linear value, precomputed once.
static const std::array<double, 256>& LinearTable()
{
    static const std::array<double, 256> table = []() {
        std::array<double, 256> t{};
        for (int i = 0; i < 256; ++i)
            t[(size_t)i] = ToneAnalyzer::SrgbToLinear((double)i / 255.0);
        return t;
    }();
    return table;
}
} // namespace

ToneAnalyzer::ToneAnalyzer(int grid_side)
    : m_grid_side(std::clamp(grid_side, 1, 256))
{
}

double ToneAnalyzer::SrgbToLinear(double v)
{
    if (v <= 0.04045)
        return v / 12.92;
    return std::pow((v + 0.055) / 1.055, 2.4);
}

double ToneAnalyzer::RelativeLuminance(int r, int g, int b)
{
    const auto& lin = LinearTable();
    return 0.2126 * lin[(size_t)std::clamp(r, 0, 255)] +
           0.7152 * lin[(size_t)std::clamp(g, 0, 255)] +
           0.0722 * lin[(size_t)std::clamp(b, 0, 255)];
}

std::optional<double> ToneAnalyzer::AverageLuminance(const Bitmap& bitmap) const
{
    Bitmap grid;
    if (!bitmap_ops::ResampleArea(bitmap, m_grid_side, m_grid_side, grid))
        return std::nullopt;

    double sum = 0.0;
    int samples = 0;
    for (size_t i = 0; i + 3 < grid.rgba.size(); i += 4)
    {
        // Fully transparent samples carry no colour information.
        if (grid.rgba[i + 3] == 0)
            continue;
        sum += RelativeLuminance(grid.rgba[i + 0], grid.rgba[i + 1], grid.rgba[i + 2]);
        ++samples;
    }
    if (samples == 0)
        return std::nullopt;
    return sum / (double)samples;
}

ToneClass ToneAnalyzer::Classify(const Bitmap& bitmap) const
{
    const std::optional<double> avg = AverageLuminance(bitmap);
    if (!avg)
        return ToneClass::Unknown;
    return (*avg > kLightThreshold) ? ToneClass::Light : ToneClass::Dark;
}
} // namespace drift

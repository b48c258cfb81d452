#pragma once

#include "rotation/rotation_types.h"

#include <optional>

namespace drift
{
struct Bitmap;

// Light/dark classification of a decoded image.
//
// The bitmap is area-averaged onto a grid_side x grid_side sampling grid, each
// sample is linearized with the sRGB transfer function, weighted with BT.709
// coefficients, and the mean relative luminance is compared against 0.6.
class ToneAnalyzer
{
public:
    static constexpr int kDefaultGridSide = 32;
    static constexpr double kLightThreshold = 0.6;

    explicit ToneAnalyzer(int grid_side = kDefaultGridSide);

    int GridSide() const { return m_grid_side; }

    // Unknown on any sampling failure; callers keep their previous tone.
    ToneClass Classify(const Bitmap& bitmap) const;

    // Mean relative luminance in [0, 1], or nullopt when the bitmap cannot be sampled.
    std::optional<double> AverageLuminance(const Bitmap& bitmap) const;

    // Gamma-encoded channel in [0, 1] -> linear light.
    static double SrgbToLinear(double v);

    // BT.709 weighted sum of 8-bit sRGB channels, linearized first.
    static double RelativeLuminance(int r, int g, int b);

private:
    int m_grid_side = kDefaultGridSide;
};
} // namespace drift

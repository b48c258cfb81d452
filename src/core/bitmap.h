#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace drift
{
// Decoded image, RGBA8, row-major, tightly packed (width * height * 4 bytes).
struct Bitmap
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> rgba;

    std::size_t ExpectedBytes() const
    {
        if (width <= 0 || height <= 0)
            return 0;
        return (std::size_t)width * (std::size_t)height * 4u;
    }

    // True when dimensions are positive and the pixel buffer matches them.
    bool Valid() const { return ExpectedBytes() != 0 && rgba.size() == ExpectedBytes(); }
};

namespace bitmap_ops
{
// Area-average `src` into a dst_w x dst_h buffer (stretch, no crop).
// Returns false if `src` is invalid or the destination size is not positive.
bool ResampleArea(const Bitmap& src, int dst_w, int dst_h, Bitmap& out);

// Three-pass separable box blur approximating a Gaussian with sigma = radius_px.
// Alpha is blurred along with colour. radius_px <= 0 leaves `img` untouched.
void BoxBlur(Bitmap& img, int radius_px);
} // namespace bitmap_ops
} // namespace drift

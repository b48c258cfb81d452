#include "core/bitmap.h"

#include <algorithm>
#include <cmath>

namespace drift::bitmap_ops
{
namespace
{
static std::uint8_t ClampU8(int v)
{
    return (std::uint8_t)std::clamp(v, 0, 255);
}

// Box widths for an n-pass box blur that approximates a Gaussian of `sigma`.
static void BoxSizesForGauss(double sigma, int n, int* out_sizes)
{
    const double w_ideal = std::sqrt((12.0 * sigma * sigma / n) + 1.0);
    int wl = (int)std::floor(w_ideal);
    if (wl % 2 == 0)
        wl--;
    const int wu = wl + 2;
    const double m_ideal = (12.0 * sigma * sigma - n * wl * wl - 4.0 * n * wl - 3.0 * n) / (-4.0 * wl - 4.0);
    const int m = (int)std::lround(m_ideal);
    for (int i = 0; i < n; ++i)
        out_sizes[i] = (i < m) ? wl : wu;
}

// One running-sum pass along rows (horizontal) or columns (vertical).
static void BoxPass(const std::vector<std::uint8_t>& src,
                    std::vector<std::uint8_t>& dst,
                    int w,
                    int h,
                    int r,
                    bool horizontal)
{
    const int lines = horizontal ? h : w;
    const int len = horizontal ? w : h;
    const int span = 2 * r + 1;

    auto index = [&](int line, int pos) -> std::size_t {
        const int x = horizontal ? pos : line;
        const int y = horizontal ? line : pos;
        return ((std::size_t)y * (std::size_t)w + (std::size_t)x) * 4u;
    };

    for (int line = 0; line < lines; ++line)
    {
        for (int c = 0; c < 4; ++c)
        {
            int acc = 0;
            for (int k = -r; k <= r; ++k)
                acc += src[index(line, std::clamp(k, 0, len - 1)) + (std::size_t)c];

            for (int pos = 0; pos < len; ++pos)
            {
                dst[index(line, pos) + (std::size_t)c] = ClampU8((int)std::lround((double)acc / (double)span));
                const int add = std::clamp(pos + r + 1, 0, len - 1);
                const int sub = std::clamp(pos - r, 0, len - 1);
                acc += (int)src[index(line, add) + (std::size_t)c] - (int)src[index(line, sub) + (std::size_t)c];
            }
        }
    }
}
} // namespace

bool ResampleArea(const Bitmap& src, int dst_w, int dst_h, Bitmap& out)
{
    if (!src.Valid() || dst_w <= 0 || dst_h <= 0)
        return false;

    out.width = dst_w;
    out.height = dst_h;
    out.rgba.assign((std::size_t)dst_w * (std::size_t)dst_h * 4u, 0);

    for (int dy = 0; dy < dst_h; ++dy)
    {
        const int y0 = (int)((long long)dy * src.height / dst_h);
        int y1 = (int)(((long long)(dy + 1) * src.height + dst_h - 1) / dst_h);
        y1 = std::max(y1, y0 + 1);

        for (int dx = 0; dx < dst_w; ++dx)
        {
            const int x0 = (int)((long long)dx * src.width / dst_w);
            int x1 = (int)(((long long)(dx + 1) * src.width + dst_w - 1) / dst_w);
            x1 = std::max(x1, x0 + 1);

            long long sum[4] = {0, 0, 0, 0};
            long long count = 0;
            for (int y = y0; y < y1 && y < src.height; ++y)
            {
                for (int x = x0; x < x1 && x < src.width; ++x)
                {
                    const std::uint8_t* p = &src.rgba[((std::size_t)y * (std::size_t)src.width + (std::size_t)x) * 4u];
                    sum[0] += p[0];
                    sum[1] += p[1];
                    sum[2] += p[2];
                    sum[3] += p[3];
                    ++count;
                }
            }

            std::uint8_t* d = &out.rgba[((std::size_t)dy * (std::size_t)dst_w + (std::size_t)dx) * 4u];
            for (int c = 0; c < 4; ++c)
                d[c] = count > 0 ? ClampU8((int)((sum[c] + count / 2) / count)) : 0;
        }
    }
    return true;
}

void BoxBlur(Bitmap& img, int radius_px)
{
    if (radius_px <= 0 || !img.Valid())
        return;

    int sizes[3] = {1, 1, 1};
    BoxSizesForGauss((double)radius_px, 3, sizes);

    std::vector<std::uint8_t> tmp(img.rgba.size());
    for (int pass = 0; pass < 3; ++pass)
    {
        const int r = std::max(0, (sizes[pass] - 1) / 2);
        if (r == 0)
            continue;
        BoxPass(img.rgba, tmp, img.width, img.height, r, /*horizontal=*/true);
        BoxPass(tmp, img.rgba, img.width, img.height, r, /*horizontal=*/false);
    }
}
} // namespace drift::bitmap_ops

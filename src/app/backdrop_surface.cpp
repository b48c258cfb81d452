#include "app/backdrop_surface.h"

#include "app/surface_texture.h"
#include "core/event_loop.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace drift
{
BackdropSurface::BackdropSurface(EventLoop& loop, SurfaceTexture& texture, const char* name)
    : m_loop(loop)
    , m_texture(texture)
    , m_name(name)
{
}

void BackdropSurface::SetBitmap(Bitmap bitmap)
{
    m_source = std::move(bitmap);
    m_dirty = true;
}

void BackdropSurface::FlushLayout()
{
    if (m_dirty)
        Upload();
}

void BackdropSurface::SetBlurPixels(unsigned px)
{
    if (px == m_blur_px)
        return;
    m_blur_px = px;
    if (m_source.Valid())
        Upload();
}

void BackdropSurface::Upload()
{
    m_dirty = false;
    if (!m_source.Valid())
        return;

    if (m_blur_px == 0)
    {
        if (!m_texture.Upload(m_source))
            std::fprintf(stderr, "[backdrop] %s: texture upload failed\n", m_name);
        return;
    }

    Bitmap blurred = m_source;
    bitmap_ops::BoxBlur(blurred, (int)m_blur_px);
    if (!m_texture.Upload(blurred))
        std::fprintf(stderr, "[backdrop] %s: texture upload failed\n", m_name);
}

void BackdropSurface::FadeTo(bool visible, std::function<void()> on_end)
{
    m_from = m_alpha;
    m_to = visible ? 1.0f : 0.0f;
    m_elapsed_s = 0.0;
    m_fading = true;
    // A superseded fade never reports its end.
    m_on_end = std::move(on_end);
}

void BackdropSurface::SetVisibleImmediate(bool visible)
{
    m_alpha = visible ? 1.0f : 0.0f;
    m_fading = false;
    m_on_end = nullptr;
}

void BackdropSurface::Advance(double dt_s)
{
    if (!m_fading)
        return;

    m_elapsed_s += std::max(0.0, dt_s);
    const double t = m_duration_s > 0.0 ? std::min(1.0, m_elapsed_s / m_duration_s) : 1.0;
    // Ease in-out (smoothstep).
    const double eased = t * t * (3.0 - 2.0 * t);
    m_alpha = (float)(m_from + (m_to - m_from) * eased);

    if (t < 1.0)
        return;

    m_fading = false;
    m_alpha = m_to;
    if (m_on_end)
    {
        m_loop.Post(std::move(m_on_end));
        m_on_end = nullptr;
    }
}

void BackdropSurface::Draw(ImDrawList* draw_list, ImVec2 p_min, ImVec2 p_max) const
{
    const SurfaceTextureView view = m_texture.View();
    if (!draw_list || !view.Valid() || m_alpha <= 0.0f)
        return;

    const float dst_w = p_max.x - p_min.x;
    const float dst_h = p_max.y - p_min.y;
    if (dst_w <= 0.0f || dst_h <= 0.0f)
        return;

    // Cover: crop the axis where the image is relatively larger.
    const float src_aspect = (float)view.width / (float)view.height;
    const float dst_aspect = dst_w / dst_h;
    ImVec2 uv0(0.0f, 0.0f);
    ImVec2 uv1(1.0f, 1.0f);
    if (src_aspect > dst_aspect)
    {
        const float keep = dst_aspect / src_aspect;
        uv0.x = (1.0f - keep) * 0.5f;
        uv1.x = uv0.x + keep;
    }
    else if (src_aspect < dst_aspect)
    {
        const float keep = src_aspect / dst_aspect;
        uv0.y = (1.0f - keep) * 0.5f;
        uv1.y = uv0.y + keep;
    }

    const ImU32 tint = IM_COL32(255, 255, 255, (int)(std::clamp(m_alpha, 0.0f, 1.0f) * 255.0f + 0.5f));
    draw_list->AddImage(view.texture_id, p_min, p_max, uv0, uv1, tint);
}
} // namespace drift

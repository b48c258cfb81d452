#pragma once

#include "core/bitmap.h"
#include "rotation/double_buffer.h"

#include "imgui.h"

#include <functional>

namespace drift
{
class EventLoop;
class SurfaceTexture;

// RenderSurface drawn as a full-window textured quad on ImGui's background
// draw list. Opacity follows FadeTo() as the host advances it each frame; a
// host that stops advancing (minimized window) never delivers the end event.
class BackdropSurface : public RenderSurface
{
public:
    BackdropSurface(EventLoop& loop, SurfaceTexture& texture, const char* name);

    void SetBitmap(Bitmap bitmap) override;
    void FadeTo(bool visible, std::function<void()> on_end) override;
    void SetVisibleImmediate(bool visible) override;
    void FlushLayout() override;

    void SetFadeDuration(double seconds) { m_duration_s = seconds; }

    // Re-uploads the current image blurred by `px` (0 = sharp).
    void SetBlurPixels(unsigned px);

    void Advance(double dt_s);

    float Alpha() const { return m_alpha; }
    bool HasImage() const { return m_source.Valid(); }

    // Scales the texture to cover [p_min, p_max], cropping the overflow.
    void Draw(ImDrawList* draw_list, ImVec2 p_min, ImVec2 p_max) const;

private:
    void Upload();

    EventLoop& m_loop;
    SurfaceTexture& m_texture;
    const char* m_name;

    Bitmap m_source; // unblurred pixels, kept for blur changes
    bool m_dirty = false;
    unsigned m_blur_px = 0;

    float m_alpha = 0.0f;
    float m_from = 0.0f;
    float m_to = 0.0f;
    double m_elapsed_s = 0.0;
    double m_duration_s = 0.6;
    bool m_fading = false;
    std::function<void()> m_on_end;
};
} // namespace drift

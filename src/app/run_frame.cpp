#include "app/run_frame.h"

#include <algorithm>
#include <cstdio>

#include <SDL3/SDL.h>

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_vulkan.h"

#include "app/app_state.h"
#include "app/backdrop_surface.h"
#include "app/vulkan_state.h"

#include "core/event_loop.h"
#include "core/frame_step.h"
#include "rotation/double_buffer.h"
#include "rotation/rotation_engine.h"

#include "ui/rotation_controls.h"
#include "ui/skin.h"

namespace drift::app
{
namespace
{
static bool IsNextImageKey(SDL_Keycode key)
{
    return key == SDLK_N || key == SDLK_RIGHT;
}

// Pushes render outputs (tone theme, blur) to the UI when they changed.
static void ApplyRenderOutputs(AppState& st)
{
    RotationEngine& engine = *st.rotation.engine;
    const RenderOutputs& out = engine.Outputs();
    if (out.Revision() == st.applied_outputs_revision)
        return;
    st.applied_outputs_revision = out.Revision();

    ui::ApplyBackdropTheme(out.ToneAttribute(), out.Overlay(), st.platform.main_scale);
    for (BackdropSurface* s : st.rotation.surfaces)
        if (s)
            s->SetBlurPixels(out.BlurPixels());
}

static void DrawBackdrop(AppState& st)
{
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImDrawList* bg = ImGui::GetBackgroundDrawList();
    const ImVec2 p_min = vp->Pos;
    const ImVec2 p_max(vp->Pos.x + vp->Size.x, vp->Pos.y + vp->Size.y);

    // Secondary under primary: during a cross-dissolve the incoming image
    // (secondary until completion) is blended under the outgoing one.
    if (const DoubleBuffer* buffer = st.rotation.engine->Buffer())
    {
        BackdropSurface* primary = st.rotation.surfaces[buffer->PrimaryIndex()];
        BackdropSurface* secondary = st.rotation.surfaces[buffer->SecondaryIndex()];
        if (secondary)
            secondary->Draw(bg, p_min, p_max);
        if (primary)
            primary->Draw(bg, p_min, p_max);
    }

    const float scrim = st.rotation.engine->Outputs().Overlay().scrim_alpha;
    if (scrim > 0.0f)
        bg->AddRectFilled(p_min, p_max, IM_COL32(0, 0, 0, (int)(scrim * 255.0f + 0.5f)));
}
} // namespace

void RunFrame(AppState& st)
{
    if (st.interrupt_requested && st.interrupt_requested())
    {
        st.done = true;
        return;
    }

    SDL_Window* window = st.platform.window;
    VulkanState& vk = *st.vulkan.vk;
    ImGui_ImplVulkanH_Window* wd = st.vulkan.wd;
    EventLoop& loop = *st.rotation.loop;
    RotationEngine& engine = *st.rotation.engine;

    const double dt_s = FrameStepSeconds(st.last_ticks_ms, SDL_GetTicks());

    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        ImGui_ImplSDL3_ProcessEvent(&event);
        if (event.type == SDL_EVENT_QUIT)
            st.done = true;
        if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED && event.window.windowID == SDL_GetWindowID(window))
            st.done = true;
        if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat && !ImGui::GetIO().WantTextInput)
        {
            if (IsNextImageKey(event.key.key))
                engine.RequestSwap();
            else if (event.key.key == SDLK_ESCAPE)
                st.done = true;
        }
    }

    // Timers and load completions run even while minimized; fades do not.
    loop.RunPending();
    ApplyRenderOutputs(st);
    // Sampled after the pending work so a swap's blur and upload are not
    // counted as fade time on the next frame.
    st.last_ticks_ms = SDL_GetTicks();

    if (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED)
    {
        SDL_Delay(10);
        return;
    }

    for (BackdropSurface* s : st.rotation.surfaces)
        if (s)
            s->Advance(dt_s);

    int fb_width = 0, fb_height = 0;
    SDL_GetWindowSize(window, &fb_width, &fb_height);
    if (fb_width > 0 && fb_height > 0 &&
        (vk.swapchain_rebuild || wd->Width != fb_width || wd->Height != fb_height))
    {
        vk.ResizeSwapchain(wd, fb_width, fb_height);
    }

    int px_w = 0, px_h = 0;
    SDL_GetWindowSizeInPixels(window, &px_w, &px_h);
    if (px_w > 0 && px_h > 0 && (px_w != st.last_viewport_w || px_h != st.last_viewport_h))
    {
        st.last_viewport_w = px_w;
        st.last_viewport_h = px_h;
        engine.SetViewport(px_w, px_h);
    }

    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
    st.frame_counter++;

    DrawBackdrop(st);
    ui::RenderRotationControls(engine, engine.Outputs().Overlay().shadow_alpha, &st.toggles.show_controls);

    // Bring the panel back after it was closed.
    if (!st.toggles.show_controls && ImGui::IsKeyPressed(ImGuiKey_F1, false))
        st.toggles.show_controls = true;

    ImGui::Render();
    ImDrawData* draw_data = ImGui::GetDrawData();
    const bool is_minimized = (draw_data->DisplaySize.x <= 0.0f || draw_data->DisplaySize.y <= 0.0f);
    if (!is_minimized)
    {
        const ImVec4& c = st.clear_color;
        wd->ClearValue.color.float32[0] = c.x * c.w;
        wd->ClearValue.color.float32[1] = c.y * c.w;
        wd->ClearValue.color.float32[2] = c.z * c.w;
        wd->ClearValue.color.float32[3] = c.w;
        if (!vk.RenderFrame(wd, draw_data) || !vk.PresentFrame(wd))
        {
            std::fprintf(stderr, "[vulkan] device lost, shutting down\n");
            st.done = true;
        }
    }
}
} // namespace drift::app

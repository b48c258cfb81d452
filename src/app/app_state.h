#pragma once

#include <cstdint>
#include <functional>

#include "imgui.h"

// Forward declarations (AppState mostly stores pointers).
struct SDL_Window;
struct ImGui_ImplVulkanH_Window;

namespace drift
{
struct VulkanState;
class EventLoop;
class RotationEngine;
class BackdropSurface;

// Integration-level container used by `RunFrame(AppState&)`. Owns only loop
// bookkeeping; the subsystems themselves are created in `main()`.
struct AppState
{
    struct Platform
    {
        SDL_Window* window = nullptr;
        float main_scale = 1.0f;
    } platform;

    struct Vulkan
    {
        VulkanState* vk = nullptr;
        ImGui_ImplVulkanH_Window* wd = nullptr;
    } vulkan;

    struct Rotation
    {
        EventLoop* loop = nullptr;
        RotationEngine* engine = nullptr;
        BackdropSurface* surfaces[2] = {nullptr, nullptr};
    } rotation;

    struct Toggles
    {
        bool show_controls = true;
    } toggles;

    ImVec4 clear_color = ImVec4(0.04f, 0.04f, 0.05f, 1.00f);

    // Graceful shutdown hook (e.g. Ctrl+C in terminal)
    std::function<bool()> interrupt_requested;

    // Frame loop bookkeeping
    bool done = false;
    int frame_counter = 0;
    std::uint64_t last_ticks_ms = 0;
    std::uint64_t applied_outputs_revision = UINT64_MAX;
    int last_viewport_w = 0;
    int last_viewport_h = 0;
};
} // namespace drift

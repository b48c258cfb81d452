#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_vulkan.h"

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>

#include <csignal>
#include <cstdio>
#include <string>
#include <vector>

#include "app/app_state.h"
#include "app/backdrop_surface.h"
#include "app/run_frame.h"
#include "app/surface_texture.h"
#include "app/vulkan_state.h"

#include "core/event_loop.h"
#include "core/paths.h"
#include "core/version.h"

#include "io/settings_file.h"

#include "rotation/image_loader.h"
#include "rotation/provider_registry.h"
#include "rotation/rotation_engine.h"
#include "rotation/transition_coordinator.h"

#include "ui/skin.h"

// Set when we receive SIGINT (Ctrl+C) so the main loop can exit cleanly.
static volatile std::sig_atomic_t g_InterruptRequested = 0;

static void HandleInterruptSignal(int signal)
{
    if (signal == SIGINT)
        g_InterruptRequested = 1;
}

static drift::DeviceHint DetectDeviceHint(SDL_Window* window)
{
    SDL_DisplayID display = SDL_GetDisplayForWindow(window);
    if (display == 0)
        display = SDL_GetPrimaryDisplay();

    SDL_Rect usable{0, 0, 1920, 1080};
    if (!SDL_GetDisplayUsableBounds(display, &usable))
        std::fprintf(stderr, "[sdl] SDL_GetDisplayUsableBounds: %s\n", SDL_GetError());

    float scale = SDL_GetDisplayContentScale(display);
    if (scale <= 0.0f)
        scale = 1.0f;
    return drift::DeviceHintForDisplay(usable.w, usable.h, scale);
}

static std::vector<drift::ProviderSpec> ProvidersFromSettings(const drift::JsonFileStore& settings)
{
    std::vector<drift::ProviderSpec> out;
    const std::vector<drift::ProviderTemplateEntry> entries = settings.ProviderTemplates();
    for (size_t i = 0; i < entries.size(); ++i)
        out.push_back(drift::ProviderSpec::FromTemplate((int)i, entries[i].name, entries[i].url_template));
    return out;
}

int main(int, char**)
{
    using namespace drift;

    // Ctrl+C requests a graceful shutdown instead of killing the process mid-frame.
    std::signal(SIGINT, HandleInterruptSignal);

    JsonFileStore settings(GetSettingsPath());
    {
        std::string err;
        if (!settings.Load(err) && !err.empty())
            std::fprintf(stderr, "[settings] %s\n", err.c_str());
    }

    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        std::fprintf(stderr, "[sdl] SDL_Init(): %s\n", SDL_GetError());
        return 1;
    }

    const float main_scale = SDL_GetDisplayContentScale(SDL_GetPrimaryDisplay());
    const SDL_WindowFlags window_flags =
        (SDL_WindowFlags)(SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    SDL_Window* window = SDL_CreateWindow("Drift", (int)(1280 * main_scale), (int)(800 * main_scale), window_flags);
    if (window == nullptr)
    {
        std::fprintf(stderr, "[sdl] SDL_CreateWindow(): %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    ImVector<const char*> extensions;
    {
        uint32_t sdl_extensions_count = 0;
        const char* const* sdl_extensions = SDL_Vulkan_GetInstanceExtensions(&sdl_extensions_count);
        for (uint32_t n = 0; n < sdl_extensions_count; n++)
            extensions.push_back(sdl_extensions[n]);
    }

    VulkanState vk;
    if (!vk.CreateDevice(extensions))
    {
        vk.DestroyDevice();
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    VkSurfaceKHR surface;
    if (!SDL_Vulkan_CreateSurface(window, vk.instance, vk.allocator, &surface))
    {
        std::fprintf(stderr, "[vulkan] failed to create Vulkan surface: %s\n", SDL_GetError());
        vk.DestroyDevice();
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    int w = 0, h = 0;
    SDL_GetWindowSize(window, &w, &h);
    ImGui_ImplVulkanH_Window* wd = &vk.main_window;
    if (!vk.CreateSwapchain(wd, surface, w, h))
    {
        vkDestroySurfaceKHR(vk.instance, surface, vk.allocator);
        vk.DestroyDevice();
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
    SDL_ShowWindow(window);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    // Settings live in settings.json; nothing to restore from imgui.ini.
    io.IniFilename = nullptr;

    ui::ApplyBackdropTheme("", OverlayTokensFor(ToneClass::Unknown), main_scale);

    ImGui_ImplSDL3_InitForVulkan(window);
    ImGui_ImplVulkan_InitInfo init_info = {};
    init_info.Instance = vk.instance;
    init_info.PhysicalDevice = vk.physical_device;
    init_info.Device = vk.device;
    init_info.QueueFamily = vk.queue_family;
    init_info.Queue = vk.queue;
    init_info.PipelineCache = vk.pipeline_cache;
    init_info.DescriptorPool = vk.descriptor_pool;
    init_info.MinImageCount = vk.min_image_count;
    init_info.ImageCount = wd->ImageCount;
    init_info.Allocator = vk.allocator;
    init_info.PipelineInfoMain.RenderPass = wd->RenderPass;
    init_info.PipelineInfoMain.Subpass = 0;
    init_info.PipelineInfoMain.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.CheckVkResultFn = CheckVkResult;
    ImGui_ImplVulkan_Init(&init_info);

    // ---------------------------------------------------------------------
    // Rotation engine and its render surfaces
    // ---------------------------------------------------------------------
    SurfaceTexture textures[2];
    {
        SurfaceTexture::InitInfo ti;
        ti.device = (void*)vk.device;
        ti.physical_device = (void*)vk.physical_device;
        ti.queue = (void*)vk.queue;
        ti.queue_family = vk.queue_family;
        ti.allocator = (void*)vk.allocator;
        if (!textures[0].Init(ti, "backdrop-a") || !textures[1].Init(ti, "backdrop-b"))
            std::fprintf(stderr, "[vulkan] backdrop textures unavailable; running without imagery\n");
    }

    EventLoop loop;
    HttpImageLoader loader(loop);

    BackdropSurface surface_a(loop, textures[0], "backdrop-a");
    BackdropSurface surface_b(loop, textures[1], "backdrop-b");
    const double fade_s = TransitionCoordinator::kCrossfadeDuration.count() / 1000.0;
    surface_a.SetFadeDuration(fade_s);
    surface_b.SetFadeDuration(fade_s);

    EngineOptions options;
    options.providers = ProvidersFromSettings(settings);
    options.fallback_url = DriftAssetPath("fallback.ppm");
    options.hint = DetectDeviceHint(window);
    SDL_GetWindowSizeInPixels(window, &options.viewport_w, &options.viewport_h);

    std::fprintf(stderr, "[drift] %s, settings %s\n", DRIFT_USER_AGENT, settings.Path().c_str());

    RotationEngine engine(loop, loader, settings, surface_a, surface_b, options);
    engine.Mount();

    // ---------------------------------------------------------------------
    // Main loop (per-frame logic lives in app::RunFrame)
    // ---------------------------------------------------------------------
    AppState st;
    st.platform.window = window;
    st.platform.main_scale = main_scale;
    st.vulkan.vk = &vk;
    st.vulkan.wd = wd;
    st.rotation.loop = &loop;
    st.rotation.engine = &engine;
    st.rotation.surfaces[0] = &surface_a;
    st.rotation.surfaces[1] = &surface_b;
    st.last_viewport_w = options.viewport_w;
    st.last_viewport_h = options.viewport_h;
    st.interrupt_requested = []() -> bool { return g_InterruptRequested != 0; };

    while (!st.done)
        app::RunFrame(st);

    // ---------------------------------------------------------------------
    // Shutdown
    // ---------------------------------------------------------------------
    engine.Unmount();
    loader.Shutdown();

    // Textures go before the ImGui Vulkan backend / Vulkan device.
    textures[0].Shutdown();
    textures[1].Shutdown();

    // The device may already be in a bad state during a Ctrl+C shutdown.
    const VkResult err = vkDeviceWaitIdle(vk.device);
    if (err != VK_SUCCESS)
        std::fprintf(stderr, "[vulkan] vkDeviceWaitIdle during shutdown: VkResult = %d (ignored)\n", err);
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    vk.DestroySwapchain();
    vk.DestroyDevice();

    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}

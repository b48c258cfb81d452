#pragma once

#include "imgui.h"
#include "imgui_impl_vulkan.h"

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>

namespace drift
{
// Vulkan instance/device/swapchain for the Dear ImGui SDL3 backend.
// Setup and per-frame calls report failure instead of exiting; once the device
// is lost the host loop shuts down.
struct VulkanState
{
    VkAllocationCallbacks* allocator = nullptr;
    VkInstance             instance = VK_NULL_HANDLE;
    VkPhysicalDevice       physical_device = VK_NULL_HANDLE;
    VkDevice               device = VK_NULL_HANDLE;
    uint32_t               queue_family = (uint32_t)-1;
    VkQueue                queue = VK_NULL_HANDLE;
    VkPipelineCache        pipeline_cache = VK_NULL_HANDLE;
    VkDescriptorPool       descriptor_pool = VK_NULL_HANDLE;

    ImGui_ImplVulkanH_Window main_window{};
    uint32_t                 min_image_count = 2;
    bool                     swapchain_rebuild = false;
    bool                     device_lost = false;

    bool CreateDevice(ImVector<const char*> instance_extensions);
    bool CreateSwapchain(ImGui_ImplVulkanH_Window* wd, VkSurfaceKHR surface, int width, int height);
    void ResizeSwapchain(ImGui_ImplVulkanH_Window* wd, int width, int height);

    // Both return false once the device is lost.
    bool RenderFrame(ImGui_ImplVulkanH_Window* wd, ImDrawData* draw_data);
    bool PresentFrame(ImGui_ImplVulkanH_Window* wd);

    void DestroySwapchain();
    void DestroyDevice();

private:
    bool CreateInstance(ImVector<const char*>& extensions);
    bool CreateLogicalDevice();
    bool CreateDescriptorPool();
    bool Fatal(const char* what, VkResult err);
};

// Passed to the ImGui Vulkan backend; logs failures.
void CheckVkResult(VkResult err);
} // namespace drift

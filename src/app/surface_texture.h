// GPU texture behind one backdrop slot.
//
// Vulkan types stay out of the header; the backdrop only needs the ImGui
// texture id, the image size and its UVs.

#pragma once

#include <cstdint>

#include "imgui.h" // ImTextureID

namespace drift
{
struct Bitmap;

struct SurfaceTextureView
{
    ImTextureID texture_id = (ImTextureID)0; // VkDescriptorSet in the Vulkan backend
    int         width = 0;
    int         height = 0;

    bool Valid() const { return texture_id != (ImTextureID)0 && width > 0 && height > 0; }
};

class SurfaceTexture
{
public:
    struct InitInfo
    {
        void*    device = nullptr;          // VkDevice
        void*    physical_device = nullptr; // VkPhysicalDevice
        void*    queue = nullptr;           // VkQueue
        uint32_t queue_family = 0;
        void*    allocator = nullptr;       // VkAllocationCallbacks* (may be null)
    };

    SurfaceTexture() = default;
    ~SurfaceTexture();

    SurfaceTexture(const SurfaceTexture&) = delete;
    SurfaceTexture& operator=(const SurfaceTexture&) = delete;

    bool Init(const InitInfo& info, const char* debug_name = "SurfaceTexture");
    void Shutdown();

    SurfaceTextureView View() const { return m_view; }

    // Uploads `bitmap` (RGBA8) into the next texture slot. The GPU objects are
    // recreated when the size changes. Returns false on any Vulkan failure; the
    // previous view stays valid in that case.
    bool Upload(const Bitmap& bitmap);

private:
    struct Impl;
    Impl* m = nullptr;
    SurfaceTextureView m_view;
};
} // namespace drift

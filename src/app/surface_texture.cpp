#include "app/surface_texture.h"

#include "core/bitmap.h"

#include "imgui_impl_vulkan.h"

#include <vulkan/vulkan.h>

#include <array>
#include <cstdio>
#include <cstring>

namespace drift
{
namespace
{
static bool Check(const char* name, const char* what, VkResult r)
{
    if (r == VK_SUCCESS)
        return true;
    std::fprintf(stderr, "[vulkan] %s: %s: VkResult = %d\n", name, what, (int)r);
    return false;
}

static void TransitionLayout(VkCommandBuffer cmd,
                             VkImage image,
                             VkImageLayout from,
                             VkImageLayout to,
                             VkAccessFlags src_access,
                             VkAccessFlags dst_access,
                             VkPipelineStageFlags src_stage,
                             VkPipelineStageFlags dst_stage)
{
    VkImageMemoryBarrier b{};
    b.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    b.srcAccessMask = src_access;
    b.dstAccessMask = dst_access;
    b.oldLayout = from;
    b.newLayout = to;
    b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.image = image;
    b.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    b.subresourceRange.levelCount = 1;
    b.subresourceRange.layerCount = 1;
    vkCmdPipelineBarrier(cmd, src_stage, dst_stage, 0, 0, nullptr, 0, nullptr, 1, &b);
}
} // namespace

struct SurfaceTexture::Impl
{
    VkDevice device = VK_NULL_HANDLE;
    VkPhysicalDevice physical = VK_NULL_HANDLE;
    VkQueue queue = VK_NULL_HANDLE;
    uint32_t queue_family = 0;
    const VkAllocationCallbacks* allocator = nullptr;
    const char* name = "SurfaceTexture";

    VkCommandPool pool = VK_NULL_HANDLE;
    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkFence fence = VK_NULL_HANDLE;
    VkSampler sampler = VK_NULL_HANDLE;

    // Persistently mapped; grows to the largest image uploaded so far.
    VkBuffer staging = VK_NULL_HANDLE;
    VkDeviceMemory staging_mem = VK_NULL_HANDLE;
    void* staging_ptr = nullptr;
    VkDeviceSize staging_size = 0;

    // Frames in flight may still sample the image shown before the upload.
    struct Slot
    {
        VkImage image = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkImageView view = VK_NULL_HANDLE;
        VkDescriptorSet set = VK_NULL_HANDLE;
        bool written = false;
    };
    std::array<Slot, 3> slots;
    size_t next_slot = 0;
    int width = 0;
    int height = 0;

    VkResult Allocate(const VkMemoryRequirements& req, VkMemoryPropertyFlags wanted, VkDeviceMemory& out)
    {
        VkPhysicalDeviceMemoryProperties props{};
        vkGetPhysicalDeviceMemoryProperties(physical, &props);
        for (uint32_t i = 0; i < props.memoryTypeCount; ++i)
        {
            if ((req.memoryTypeBits & (1u << i)) == 0 || (props.memoryTypes[i].propertyFlags & wanted) != wanted)
                continue;
            VkMemoryAllocateInfo ai{};
            ai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
            ai.allocationSize = req.size;
            ai.memoryTypeIndex = i;
            return vkAllocateMemory(device, &ai, allocator, &out);
        }
        return VK_ERROR_FEATURE_NOT_PRESENT;
    }

    bool CreateObjects()
    {
        VkCommandPoolCreateInfo pci{};
        pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        pci.queueFamilyIndex = queue_family;
        pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT | VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
        if (!Check(name, "vkCreateCommandPool", vkCreateCommandPool(device, &pci, allocator, &pool)))
            return false;

        VkCommandBufferAllocateInfo cai{};
        cai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        cai.commandPool = pool;
        cai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        cai.commandBufferCount = 1;
        if (!Check(name, "vkAllocateCommandBuffers", vkAllocateCommandBuffers(device, &cai, &cmd)))
            return false;

        VkFenceCreateInfo fci{};
        fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        if (!Check(name, "vkCreateFence", vkCreateFence(device, &fci, allocator, &fence)))
            return false;

        // Photos are scaled to cover the window.
        VkSamplerCreateInfo sci{};
        sci.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        sci.magFilter = VK_FILTER_LINEAR;
        sci.minFilter = VK_FILTER_LINEAR;
        sci.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
        sci.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        sci.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        sci.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        sci.maxAnisotropy = 1.0f;
        return Check(name, "vkCreateSampler", vkCreateSampler(device, &sci, allocator, &sampler));
    }

    void DestroyStaging()
    {
        if (staging_ptr)
            vkUnmapMemory(device, staging_mem);
        if (staging != VK_NULL_HANDLE)
            vkDestroyBuffer(device, staging, allocator);
        if (staging_mem != VK_NULL_HANDLE)
            vkFreeMemory(device, staging_mem, allocator);
        staging = VK_NULL_HANDLE;
        staging_mem = VK_NULL_HANDLE;
        staging_ptr = nullptr;
        staging_size = 0;
    }

    bool EnsureStaging(VkDeviceSize bytes)
    {
        if (staging_size >= bytes)
            return true;
        DestroyStaging();

        VkBufferCreateInfo bi{};
        bi.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bi.size = bytes;
        bi.usage = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
        bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        if (!Check(name, "vkCreateBuffer", vkCreateBuffer(device, &bi, allocator, &staging)))
            return false;

        VkMemoryRequirements req{};
        vkGetBufferMemoryRequirements(device, staging, &req);
        const VkMemoryPropertyFlags host = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        if (!Check(name, "staging memory", Allocate(req, host, staging_mem)) ||
            !Check(name, "vkBindBufferMemory", vkBindBufferMemory(device, staging, staging_mem, 0)) ||
            !Check(name, "vkMapMemory", vkMapMemory(device, staging_mem, 0, bytes, 0, &staging_ptr)))
        {
            DestroyStaging();
            return false;
        }
        staging_size = bytes;
        return true;
    }

    void DestroySlot(Slot& s)
    {
        if (s.set != VK_NULL_HANDLE)
            ImGui_ImplVulkan_RemoveTexture(s.set);
        if (s.view != VK_NULL_HANDLE)
            vkDestroyImageView(device, s.view, allocator);
        if (s.image != VK_NULL_HANDLE)
            vkDestroyImage(device, s.image, allocator);
        if (s.memory != VK_NULL_HANDLE)
            vkFreeMemory(device, s.memory, allocator);
        s = Slot{};
    }

    bool CreateSlot(Slot& s, int w, int h)
    {
        VkImageCreateInfo ii{};
        ii.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        ii.imageType = VK_IMAGE_TYPE_2D;
        ii.format = VK_FORMAT_R8G8B8A8_UNORM;
        ii.extent = {(uint32_t)w, (uint32_t)h, 1};
        ii.mipLevels = 1;
        ii.arrayLayers = 1;
        ii.samples = VK_SAMPLE_COUNT_1_BIT;
        ii.tiling = VK_IMAGE_TILING_OPTIMAL;
        ii.usage = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        ii.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        ii.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        if (!Check(name, "vkCreateImage", vkCreateImage(device, &ii, allocator, &s.image)))
            return false;

        VkMemoryRequirements req{};
        vkGetImageMemoryRequirements(device, s.image, &req);
        if (!Check(name, "image memory", Allocate(req, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, s.memory)) ||
            !Check(name, "vkBindImageMemory", vkBindImageMemory(device, s.image, s.memory, 0)))
            return false;

        VkImageViewCreateInfo vi{};
        vi.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        vi.image = s.image;
        vi.viewType = VK_IMAGE_VIEW_TYPE_2D;
        vi.format = ii.format;
        vi.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        vi.subresourceRange.levelCount = 1;
        vi.subresourceRange.layerCount = 1;
        if (!Check(name, "vkCreateImageView", vkCreateImageView(device, &vi, allocator, &s.view)))
            return false;

        s.set = ImGui_ImplVulkan_AddTexture(sampler, s.view, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        return s.set != VK_NULL_HANDLE;
    }

    void DestroySlots()
    {
        // The previous images may still be referenced by a frame in flight.
        if (queue != VK_NULL_HANDLE)
            vkQueueWaitIdle(queue);
        for (Slot& s : slots)
            DestroySlot(s);
        next_slot = 0;
        width = 0;
        height = 0;
    }

    bool EnsureSlots(int w, int h)
    {
        if (w == width && h == height && slots[0].set != VK_NULL_HANDLE)
            return true;

        DestroySlots();
        for (Slot& s : slots)
        {
            if (!CreateSlot(s, w, h))
            {
                std::fprintf(stderr, "[vulkan] %s: could not allocate %dx%d images\n", name, w, h);
                DestroySlots();
                return false;
            }
        }
        width = w;
        height = h;
        return true;
    }

    bool CopyToSlot(Slot& s)
    {
        if (!Check(name, "vkResetCommandBuffer", vkResetCommandBuffer(cmd, 0)))
            return false;

        VkCommandBufferBeginInfo bi{};
        bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        if (!Check(name, "vkBeginCommandBuffer", vkBeginCommandBuffer(cmd, &bi)))
            return false;

        if (s.written)
            TransitionLayout(cmd, s.image,
                             VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                             VK_ACCESS_SHADER_READ_BIT, VK_ACCESS_TRANSFER_WRITE_BIT,
                             VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);
        else
            TransitionLayout(cmd, s.image,
                             VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                             0, VK_ACCESS_TRANSFER_WRITE_BIT,
                             VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);

        VkBufferImageCopy region{};
        region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        region.imageSubresource.layerCount = 1;
        region.imageExtent = {(uint32_t)width, (uint32_t)height, 1};
        vkCmdCopyBufferToImage(cmd, staging, s.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

        TransitionLayout(cmd, s.image,
                         VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                         VK_ACCESS_TRANSFER_WRITE_BIT, VK_ACCESS_SHADER_READ_BIT,
                         VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);

        if (!Check(name, "vkEndCommandBuffer", vkEndCommandBuffer(cmd)))
            return false;

        VkSubmitInfo si{};
        si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        si.commandBufferCount = 1;
        si.pCommandBuffers = &cmd;
        if (!Check(name, "vkResetFences", vkResetFences(device, 1, &fence)) ||
            !Check(name, "vkQueueSubmit", vkQueueSubmit(queue, 1, &si, fence)) ||
            !Check(name, "vkWaitForFences", vkWaitForFences(device, 1, &fence, VK_TRUE, UINT64_MAX)))
            return false;

        s.written = true;
        return true;
    }

    void Destroy()
    {
        DestroySlots();
        DestroyStaging();
        if (sampler != VK_NULL_HANDLE)
            vkDestroySampler(device, sampler, allocator);
        if (fence != VK_NULL_HANDLE)
            vkDestroyFence(device, fence, allocator);
        if (pool != VK_NULL_HANDLE)
            vkDestroyCommandPool(device, pool, allocator);
        sampler = VK_NULL_HANDLE;
        fence = VK_NULL_HANDLE;
        pool = VK_NULL_HANDLE;
        cmd = VK_NULL_HANDLE;
    }
};

SurfaceTexture::~SurfaceTexture()
{
    Shutdown();
}

bool SurfaceTexture::Init(const InitInfo& info, const char* debug_name)
{
    Shutdown();
    if (!info.device || !info.physical_device || !info.queue)
        return false;

    m = new Impl();
    m->device = (VkDevice)info.device;
    m->physical = (VkPhysicalDevice)info.physical_device;
    m->queue = (VkQueue)info.queue;
    m->queue_family = info.queue_family;
    m->allocator = (const VkAllocationCallbacks*)info.allocator;
    if (debug_name)
        m->name = debug_name;

    if (!m->CreateObjects())
    {
        Shutdown();
        return false;
    }
    return true;
}

void SurfaceTexture::Shutdown()
{
    if (m)
    {
        m->Destroy();
        delete m;
        m = nullptr;
    }
    m_view = SurfaceTextureView{};
}

bool SurfaceTexture::Upload(const Bitmap& bitmap)
{
    if (!m || !bitmap.Valid())
        return false;

    // Resizing destroys every slot, the displayed one included.
    if (bitmap.width != m->width || bitmap.height != m->height)
        m_view = SurfaceTextureView{};
    if (!m->EnsureSlots(bitmap.width, bitmap.height))
        return false;

    const VkDeviceSize bytes = (VkDeviceSize)bitmap.rgba.size();
    if (!m->EnsureStaging(bytes))
        return false;
    std::memcpy(m->staging_ptr, bitmap.rgba.data(), (size_t)bytes);

    Impl::Slot& slot = m->slots[m->next_slot];
    m->next_slot = (m->next_slot + 1) % m->slots.size();
    if (!m->CopyToSlot(slot))
        return false;

    m_view.texture_id = (ImTextureID)slot.set;
    m_view.width = bitmap.width;
    m_view.height = bitmap.height;
    return true;
}
} // namespace drift

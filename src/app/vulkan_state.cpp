#include "app/vulkan_state.h"

#include <cstdio>
#include <cstring>

namespace drift
{
namespace
{
static bool HasExtension(const ImVector<VkExtensionProperties>& available, const char* name)
{
    for (const VkExtensionProperties& p : available)
        if (std::strcmp(p.extensionName, name) == 0)
            return true;
    return false;
}

static ImVector<VkExtensionProperties> InstanceExtensions()
{
    ImVector<VkExtensionProperties> out;
    uint32_t count = 0;
    if (vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr) != VK_SUCCESS)
        return out;
    out.resize((int)count);
    if (vkEnumerateInstanceExtensionProperties(nullptr, &count, out.Data) != VK_SUCCESS)
        out.clear();
    return out;
}

static ImVector<VkExtensionProperties> DeviceExtensions(VkPhysicalDevice phys)
{
    ImVector<VkExtensionProperties> out;
    uint32_t count = 0;
    if (vkEnumerateDeviceExtensionProperties(phys, nullptr, &count, nullptr) != VK_SUCCESS)
        return out;
    out.resize((int)count);
    if (vkEnumerateDeviceExtensionProperties(phys, nullptr, &count, out.Data) != VK_SUCCESS)
        out.clear();
    return out;
}
} // namespace

void CheckVkResult(VkResult err)
{
    if (err != VK_SUCCESS)
        std::fprintf(stderr, "[vulkan] VkResult = %d\n", err);
}

bool VulkanState::Fatal(const char* what, VkResult err)
{
    std::fprintf(stderr, "[vulkan] %s: VkResult = %d\n", what, err);
    if (err == VK_ERROR_DEVICE_LOST)
        device_lost = true;
    return false;
}

bool VulkanState::CreateInstance(ImVector<const char*>& extensions)
{
    const ImVector<VkExtensionProperties> available = InstanceExtensions();

    VkInstanceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    if (HasExtension(available, VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME))
        extensions.push_back(VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME);
#ifdef VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME
    if (HasExtension(available, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME))
    {
        extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
        ci.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
    }
#endif
    ci.enabledExtensionCount = (uint32_t)extensions.Size;
    ci.ppEnabledExtensionNames = extensions.Data;

    const VkResult err = vkCreateInstance(&ci, allocator, &instance);
    return err == VK_SUCCESS || Fatal("vkCreateInstance", err);
}

bool VulkanState::CreateLogicalDevice()
{
    physical_device = ImGui_ImplVulkanH_SelectPhysicalDevice(instance);
    if (physical_device == VK_NULL_HANDLE)
    {
        std::fprintf(stderr, "[vulkan] no usable physical device\n");
        return false;
    }
    queue_family = ImGui_ImplVulkanH_SelectQueueFamilyIndex(physical_device);
    if (queue_family == (uint32_t)-1)
    {
        std::fprintf(stderr, "[vulkan] no graphics queue family\n");
        return false;
    }

    ImVector<const char*> extensions;
    extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
#ifdef VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME
    if (HasExtension(DeviceExtensions(physical_device), VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME))
        extensions.push_back(VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME);
#endif

    const float priority = 1.0f;
    VkDeviceQueueCreateInfo qi{};
    qi.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qi.queueFamilyIndex = queue_family;
    qi.queueCount = 1;
    qi.pQueuePriorities = &priority;

    VkDeviceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.queueCreateInfoCount = 1;
    ci.pQueueCreateInfos = &qi;
    ci.enabledExtensionCount = (uint32_t)extensions.Size;
    ci.ppEnabledExtensionNames = extensions.Data;

    const VkResult err = vkCreateDevice(physical_device, &ci, allocator, &device);
    if (err != VK_SUCCESS)
        return Fatal("vkCreateDevice", err);
    vkGetDeviceQueue(device, queue_family, 0, &queue);
    return true;
}

bool VulkanState::CreateDescriptorPool()
{
    // Font atlas plus two backdrop surfaces with three texture slots each.
    VkDescriptorPoolSize size{VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
                              IMGUI_IMPL_VULKAN_MINIMUM_IMAGE_SAMPLER_POOL_SIZE + 2 * 3};

    VkDescriptorPoolCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    ci.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    ci.maxSets = size.descriptorCount;
    ci.poolSizeCount = 1;
    ci.pPoolSizes = &size;

    const VkResult err = vkCreateDescriptorPool(device, &ci, allocator, &descriptor_pool);
    return err == VK_SUCCESS || Fatal("vkCreateDescriptorPool", err);
}

bool VulkanState::CreateDevice(ImVector<const char*> instance_extensions)
{
    return CreateInstance(instance_extensions) && CreateLogicalDevice() && CreateDescriptorPool();
}

bool VulkanState::CreateSwapchain(ImGui_ImplVulkanH_Window* wd, VkSurfaceKHR surface, int width, int height)
{
    wd->Surface = surface;

    VkBool32 supported = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(physical_device, queue_family, wd->Surface, &supported);
    if (supported != VK_TRUE)
    {
        std::fprintf(stderr, "[vulkan] selected device cannot present to the window surface\n");
        return false;
    }

    const VkFormat formats[] = {
        VK_FORMAT_B8G8R8A8_UNORM,
        VK_FORMAT_R8G8B8A8_UNORM,
        VK_FORMAT_B8G8R8_UNORM,
        VK_FORMAT_R8G8B8_UNORM,
    };
    wd->SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(physical_device, wd->Surface, formats,
                                                              (size_t)IM_ARRAYSIZE(formats),
                                                              VK_COLORSPACE_SRGB_NONLINEAR_KHR);

    // A backdrop has no use for frames beyond the display's refresh.
    VkPresentModeKHR fifo = VK_PRESENT_MODE_FIFO_KHR;
    wd->PresentMode = ImGui_ImplVulkanH_SelectPresentMode(physical_device, wd->Surface, &fifo, 1);

    ImGui_ImplVulkanH_CreateOrResizeWindow(instance, physical_device, device, wd, queue_family, allocator,
                                           width, height, min_image_count, 0);
    return true;
}

void VulkanState::ResizeSwapchain(ImGui_ImplVulkanH_Window* wd, int width, int height)
{
    ImGui_ImplVulkan_SetMinImageCount(min_image_count);
    ImGui_ImplVulkanH_CreateOrResizeWindow(instance, physical_device, device, wd, queue_family, allocator,
                                           width, height, min_image_count, 0);
    wd->FrameIndex = 0;
    swapchain_rebuild = false;
}

bool VulkanState::RenderFrame(ImGui_ImplVulkanH_Window* wd, ImDrawData* draw_data)
{
    if (device_lost)
        return false;

    const ImGui_ImplVulkanH_FrameSemaphores& sems = wd->FrameSemaphores[wd->SemaphoreIndex];
    VkResult err = vkAcquireNextImageKHR(device, wd->Swapchain, UINT64_MAX, sems.ImageAcquiredSemaphore,
                                         VK_NULL_HANDLE, &wd->FrameIndex);
    if (err == VK_ERROR_OUT_OF_DATE_KHR)
    {
        swapchain_rebuild = true;
        return true;
    }
    if (err == VK_SUBOPTIMAL_KHR)
        swapchain_rebuild = true;
    else if (err != VK_SUCCESS)
        return Fatal("vkAcquireNextImageKHR", err);

    ImGui_ImplVulkanH_Frame& fd = wd->Frames[wd->FrameIndex];
    if ((err = vkWaitForFences(device, 1, &fd.Fence, VK_TRUE, UINT64_MAX)) != VK_SUCCESS)
        return Fatal("vkWaitForFences", err);
    if ((err = vkResetFences(device, 1, &fd.Fence)) != VK_SUCCESS)
        return Fatal("vkResetFences", err);
    if ((err = vkResetCommandPool(device, fd.CommandPool, 0)) != VK_SUCCESS)
        return Fatal("vkResetCommandPool", err);

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if ((err = vkBeginCommandBuffer(fd.CommandBuffer, &begin)) != VK_SUCCESS)
        return Fatal("vkBeginCommandBuffer", err);

    VkRenderPassBeginInfo pass{};
    pass.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    pass.renderPass = wd->RenderPass;
    pass.framebuffer = fd.Framebuffer;
    pass.renderArea.extent.width = (uint32_t)wd->Width;
    pass.renderArea.extent.height = (uint32_t)wd->Height;
    pass.clearValueCount = 1;
    pass.pClearValues = &wd->ClearValue;
    vkCmdBeginRenderPass(fd.CommandBuffer, &pass, VK_SUBPASS_CONTENTS_INLINE);
    ImGui_ImplVulkan_RenderDrawData(draw_data, fd.CommandBuffer);
    vkCmdEndRenderPass(fd.CommandBuffer);

    if ((err = vkEndCommandBuffer(fd.CommandBuffer)) != VK_SUCCESS)
        return Fatal("vkEndCommandBuffer", err);

    const VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo submit{};
    submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount = 1;
    submit.pWaitSemaphores = &sems.ImageAcquiredSemaphore;
    submit.pWaitDstStageMask = &wait_stage;
    submit.commandBufferCount = 1;
    submit.pCommandBuffers = &fd.CommandBuffer;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores = &sems.RenderCompleteSemaphore;
    if ((err = vkQueueSubmit(queue, 1, &submit, fd.Fence)) != VK_SUCCESS)
        return Fatal("vkQueueSubmit", err);
    return true;
}

bool VulkanState::PresentFrame(ImGui_ImplVulkanH_Window* wd)
{
    if (device_lost)
        return false;
    if (swapchain_rebuild)
        return true;

    VkPresentInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores = &wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;
    info.swapchainCount = 1;
    info.pSwapchains = &wd->Swapchain;
    info.pImageIndices = &wd->FrameIndex;

    const VkResult err = vkQueuePresentKHR(queue, &info);
    if (err == VK_ERROR_OUT_OF_DATE_KHR)
    {
        swapchain_rebuild = true;
        return true;
    }
    if (err == VK_SUBOPTIMAL_KHR)
        swapchain_rebuild = true;
    else if (err != VK_SUCCESS)
        return Fatal("vkQueuePresentKHR", err);

    wd->SemaphoreIndex = (wd->SemaphoreIndex + 1) % wd->SemaphoreCount;
    return true;
}

void VulkanState::DestroySwapchain()
{
    ImGui_ImplVulkanH_DestroyWindow(instance, device, &main_window, allocator);
}

void VulkanState::DestroyDevice()
{
    if (descriptor_pool != VK_NULL_HANDLE)
        vkDestroyDescriptorPool(device, descriptor_pool, allocator);
    if (device != VK_NULL_HANDLE)
        vkDestroyDevice(device, allocator);
    if (instance != VK_NULL_HANDLE)
        vkDestroyInstance(instance, allocator);
    descriptor_pool = VK_NULL_HANDLE;
    device = VK_NULL_HANDLE;
    instance = VK_NULL_HANDLE;
}
} // namespace drift

#include "vk_presenter.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_vulkan.h>
#include <stdexcept>
#include <tlviz/logger.hpp>

namespace tlviz::vk
{

VulkanPresenter::~VulkanPresenter()
{
    shutdown();
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

void VulkanPresenter::init(GLFWwindow* window, bool vsync, bool enable_validation)
{
    window_ = window;
    vsync_  = vsync;

    ctx_.instance = create_instance(enable_validation);
    if (enable_validation)
        ctx_.debug_messenger = create_debug_messenger(ctx_.instance);

    if (glfwCreateWindowSurface(ctx_.instance, window_, nullptr, &surface_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create window surface");

    ctx_.physical_device = pick_physical_device(ctx_.instance, surface_);
    ctx_.queue_families  = find_queue_families(ctx_.physical_device, surface_);
    ctx_.device = create_logical_device(ctx_.physical_device, ctx_.queue_families, enable_validation);
    vkGetDeviceQueue(ctx_.device, *ctx_.queue_families.graphics, 0, &ctx_.graphics_queue);
    vkGetDeviceQueue(ctx_.device, *ctx_.queue_families.present, 0, &ctx_.present_queue);

    int w = 0, h = 0;
    glfwGetFramebufferSize(window_, &w, &h);
    swapchain_ = create_swapchain(ctx_.device, ctx_.physical_device, surface_, static_cast<uint32_t>(w),
                                  static_cast<uint32_t>(h), *ctx_.queue_families.graphics,
                                  *ctx_.queue_families.present, vsync_);

    create_command_objects();
    create_descriptor_pool();
    create_render_finished_semaphores();

    TLVIZ_LOG_INFO("vulkan", "Presenter ready: {}x{}, vsync {}", swapchain_.extent.width,
                   swapchain_.extent.height, vsync_);
}

void VulkanPresenter::shutdown()
{
    if (ctx_.device == VK_NULL_HANDLE)
        return;

    vkDeviceWaitIdle(ctx_.device);
    shutdown_imgui();

    destroy_render_finished_semaphores();
    for (auto& frame : frames_)
    {
        vkDestroySemaphore(ctx_.device, frame.image_available, nullptr);
        vkDestroyFence(ctx_.device, frame.in_flight, nullptr);
        frame = FrameSync{};
    }

    vkDestroyDescriptorPool(ctx_.device, descriptor_pool_, nullptr);
    vkDestroyCommandPool(ctx_.device, command_pool_, nullptr);
    descriptor_pool_ = VK_NULL_HANDLE;
    command_pool_    = VK_NULL_HANDLE;

    destroy_swapchain(ctx_.device, swapchain_);
    vkDestroyDevice(ctx_.device, nullptr);
    ctx_.device = VK_NULL_HANDLE;

    vkDestroySurfaceKHR(ctx_.instance, surface_, nullptr);
    surface_ = VK_NULL_HANDLE;
    destroy_debug_messenger(ctx_.instance, ctx_.debug_messenger);
    vkDestroyInstance(ctx_.instance, nullptr);
    ctx_ = DeviceContext{};

    TLVIZ_LOG_DEBUG("vulkan", "Presenter shut down");
}

void VulkanPresenter::create_command_objects()
{
    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pool_info.queueFamilyIndex = *ctx_.queue_families.graphics;
    if (vkCreateCommandPool(ctx_.device, &pool_info, nullptr, &command_pool_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create command pool");

    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (auto& frame : frames_)
    {
        VkCommandBufferAllocateInfo alloc{};
        alloc.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        alloc.commandPool        = command_pool_;
        alloc.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        alloc.commandBufferCount = 1;
        if (vkAllocateCommandBuffers(ctx_.device, &alloc, &frame.command_buffer) != VK_SUCCESS)
            throw std::runtime_error("Failed to allocate command buffer");

        if (vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &frame.image_available) != VK_SUCCESS
            || vkCreateFence(ctx_.device, &fence_info, nullptr, &frame.in_flight) != VK_SUCCESS)
        {
            throw std::runtime_error("Failed to create sync objects");
        }
    }
}

void VulkanPresenter::create_descriptor_pool()
{
    VkDescriptorPoolSize pool_sizes[] = {
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16},
    };

    VkDescriptorPoolCreateInfo info{};
    info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    info.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    info.maxSets       = 16;
    info.poolSizeCount = 1;
    info.pPoolSizes    = pool_sizes;

    if (vkCreateDescriptorPool(ctx_.device, &info, nullptr, &descriptor_pool_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create descriptor pool");
}

void VulkanPresenter::create_render_finished_semaphores()
{
    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    render_finished_.resize(swapchain_.images.size(), VK_NULL_HANDLE);
    for (auto& sem : render_finished_)
    {
        if (vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &sem) != VK_SUCCESS)
            throw std::runtime_error("Failed to create sync objects");
    }
}

void VulkanPresenter::destroy_render_finished_semaphores()
{
    for (auto sem : render_finished_)
        vkDestroySemaphore(ctx_.device, sem, nullptr);
    render_finished_.clear();
}

// ─── ImGui backend ──────────────────────────────────────────────────────────

void VulkanPresenter::init_imgui()
{
    ImGui_ImplVulkan_InitInfo ii{};
    ii.Instance       = ctx_.instance;
    ii.PhysicalDevice = ctx_.physical_device;
    ii.Device         = ctx_.device;
    ii.QueueFamily    = *ctx_.queue_families.graphics;
    ii.Queue          = ctx_.graphics_queue;
    ii.DescriptorPool = descriptor_pool_;
    ii.MinImageCount  = swapchain_.min_image_count;
    ii.ImageCount     = static_cast<uint32_t>(swapchain_.images.size());
    ii.RenderPass     = swapchain_.render_pass;
    ii.MSAASamples    = VK_SAMPLE_COUNT_1_BIT;

    if (!ImGui_ImplVulkan_Init(&ii))
        throw std::runtime_error("Failed to initialize ImGui Vulkan backend");
    ImGui_ImplVulkan_CreateFontsTexture();
    imgui_ready_ = true;
}

void VulkanPresenter::shutdown_imgui()
{
    if (!imgui_ready_)
        return;
    vkDeviceWaitIdle(ctx_.device);
    ImGui_ImplVulkan_Shutdown();
    imgui_ready_ = false;
}

// ─── Frame ──────────────────────────────────────────────────────────────────

void VulkanPresenter::on_resize(uint32_t width, uint32_t height)
{
    needs_resize_   = true;
    pending_width_  = width;
    pending_height_ = height;
}

void VulkanPresenter::recreate_swapchain()
{
    vkDeviceWaitIdle(ctx_.device);

    int w = 0, h = 0;
    glfwGetFramebufferSize(window_, &w, &h);
    if (w == 0 || h == 0)
        return;

    VkRenderPass     render_pass = swapchain_.render_pass;
    SwapchainContext old         = swapchain_;
    swapchain_ = create_swapchain(ctx_.device, ctx_.physical_device, surface_, static_cast<uint32_t>(w),
                                  static_cast<uint32_t>(h), *ctx_.queue_families.graphics,
                                  *ctx_.queue_families.present, vsync_, old.swapchain, render_pass);
    destroy_swapchain(ctx_.device, old, true);

    destroy_render_finished_semaphores();
    create_render_finished_semaphores();

    if (imgui_ready_)
        ImGui_ImplVulkan_SetMinImageCount(swapchain_.min_image_count);

    needs_resize_ = false;
    TLVIZ_LOG_DEBUG("vulkan", "Swapchain recreated for {}x{} (requested {}x{})", swapchain_.extent.width,
                    swapchain_.extent.height, pending_width_, pending_height_);
}

bool VulkanPresenter::begin_frame(const Color& clear_color)
{
    if (needs_resize_)
    {
        recreate_swapchain();
        return false;
    }

    FrameSync& frame = frames_[current_frame_];
    vkWaitForFences(ctx_.device, 1, &frame.in_flight, VK_TRUE, UINT64_MAX);

    VkResult result = vkAcquireNextImageKHR(ctx_.device, swapchain_.swapchain, UINT64_MAX,
                                            frame.image_available, VK_NULL_HANDLE, &image_index_);
    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        recreate_swapchain();
        return false;
    }
    if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR)
        throw std::runtime_error("Failed to acquire swapchain image");

    vkResetFences(ctx_.device, 1, &frame.in_flight);
    vkResetCommandBuffer(frame.command_buffer, 0);

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (vkBeginCommandBuffer(frame.command_buffer, &begin) != VK_SUCCESS)
        throw std::runtime_error("Failed to begin command buffer");

    VkClearValue clear{};
    clear.color = {{clear_color.r, clear_color.g, clear_color.b, clear_color.a}};

    VkRenderPassBeginInfo rp{};
    rp.sType             = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rp.renderPass        = swapchain_.render_pass;
    rp.framebuffer       = swapchain_.framebuffers[image_index_];
    rp.renderArea.extent = swapchain_.extent;
    rp.clearValueCount   = 1;
    rp.pClearValues      = &clear;
    vkCmdBeginRenderPass(frame.command_buffer, &rp, VK_SUBPASS_CONTENTS_INLINE);

    frame_open_ = true;
    return true;
}

void VulkanPresenter::end_frame()
{
    if (!frame_open_)
        return;
    frame_open_ = false;

    FrameSync& frame = frames_[current_frame_];

    if (ImDrawData* dd = ImGui::GetDrawData())
        ImGui_ImplVulkan_RenderDrawData(dd, frame.command_buffer);

    vkCmdEndRenderPass(frame.command_buffer);
    if (vkEndCommandBuffer(frame.command_buffer) != VK_SUCCESS)
        throw std::runtime_error("Failed to record command buffer");

    VkSemaphore          signal     = render_finished_[image_index_];
    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo submit{};
    submit.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount   = 1;
    submit.pWaitSemaphores      = &frame.image_available;
    submit.pWaitDstStageMask    = &wait_stage;
    submit.commandBufferCount   = 1;
    submit.pCommandBuffers      = &frame.command_buffer;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores    = &signal;
    if (vkQueueSubmit(ctx_.graphics_queue, 1, &submit, frame.in_flight) != VK_SUCCESS)
        throw std::runtime_error("Failed to submit frame");

    VkPresentInfoKHR present{};
    present.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores    = &signal;
    present.swapchainCount     = 1;
    present.pSwapchains        = &swapchain_.swapchain;
    present.pImageIndices      = &image_index_;

    VkResult result = vkQueuePresentKHR(ctx_.present_queue, &present);
    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
        needs_resize_ = true;
    else if (result != VK_SUCCESS)
        throw std::runtime_error("Failed to present frame");

    current_frame_ = (current_frame_ + 1) % MAX_FRAMES_IN_FLIGHT;
}

}   // namespace tlviz::vk

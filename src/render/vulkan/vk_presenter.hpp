#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

#include "vk_device.hpp"
#include "vk_swapchain.hpp"
#include <tlviz/color.hpp>

struct GLFWwindow;

namespace tlviz::vk
{

// Window presenter for the viewer: owns the Vulkan device, the swapchain and
// per-frame synchronisation, and hosts ImGui's Vulkan backend. All failures
// throw std::runtime_error.
class VulkanPresenter
{
   public:
    VulkanPresenter() = default;
    ~VulkanPresenter();

    VulkanPresenter(const VulkanPresenter&)            = delete;
    VulkanPresenter& operator=(const VulkanPresenter&) = delete;

    void init(GLFWwindow* window, bool vsync, bool enable_validation);
    void shutdown();

    // ImGui context must exist. Installs the Vulkan renderer backend.
    void init_imgui();
    void shutdown_imgui();

    // Acquire the next image and open its render pass, cleared to clear_color.
    // Returns false (nothing to draw) when the swapchain had to be rebuilt.
    bool begin_frame(const Color& clear_color);
    // Record ImGui's draw data, submit and present.
    void end_frame();

    void on_resize(uint32_t width, uint32_t height);

    VkExtent2D extent() const { return swapchain_.extent; }

   private:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    struct FrameSync
    {
        VkCommandBuffer command_buffer  = VK_NULL_HANDLE;
        VkSemaphore     image_available = VK_NULL_HANDLE;
        VkFence         in_flight       = VK_NULL_HANDLE;
    };

    GLFWwindow*      window_ = nullptr;
    DeviceContext    ctx_;
    VkSurfaceKHR     surface_ = VK_NULL_HANDLE;
    SwapchainContext swapchain_;
    bool             vsync_ = true;

    VkCommandPool    command_pool_    = VK_NULL_HANDLE;
    VkDescriptorPool descriptor_pool_ = VK_NULL_HANDLE;

    std::array<FrameSync, MAX_FRAMES_IN_FLIGHT> frames_{};
    // Signalled per swapchain image; indexed by image.
    std::vector<VkSemaphore> render_finished_;

    uint32_t current_frame_  = 0;
    uint32_t image_index_    = 0;
    bool     frame_open_     = false;
    bool     needs_resize_   = false;
    bool     imgui_ready_    = false;
    uint32_t pending_width_  = 0;
    uint32_t pending_height_ = 0;

    void create_command_objects();
    void create_descriptor_pool();
    void create_render_finished_semaphores();
    void destroy_render_finished_semaphores();
    void recreate_swapchain();
};

}   // namespace tlviz::vk

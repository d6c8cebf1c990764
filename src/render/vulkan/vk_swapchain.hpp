#pragma once

#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

namespace tlviz::vk
{

struct SwapchainContext
{
    VkSwapchainKHR             swapchain    = VK_NULL_HANDLE;
    VkFormat                   image_format = VK_FORMAT_B8G8R8A8_UNORM;
    VkExtent2D                 extent       = {0, 0};
    std::vector<VkImage>       images;
    std::vector<VkImageView>   image_views;
    VkRenderPass               render_pass = VK_NULL_HANDLE;
    std::vector<VkFramebuffer> framebuffers;
    uint32_t                   min_image_count = 2;
};

struct SwapchainSupportDetails
{
    VkSurfaceCapabilitiesKHR        capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR>   present_modes;
};

SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface);

// UNORM so ImGui's vertex colours reach the screen unconverted.
VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats);
// FIFO with vsync; otherwise MAILBOX, then IMMEDIATE, when offered.
VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR>& modes, bool vsync);
VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& capabilities, uint32_t width, uint32_t height);

// Single colour attachment, cleared on load, presented on store.
VkRenderPass create_render_pass(VkDevice device, VkFormat color_format);

// Throws std::runtime_error on any Vulkan failure. Reuses reuse_render_pass
// when given (same format across recreation).
SwapchainContext create_swapchain(VkDevice         device,
                                  VkPhysicalDevice physical_device,
                                  VkSurfaceKHR     surface,
                                  uint32_t         width,
                                  uint32_t         height,
                                  uint32_t         graphics_family,
                                  uint32_t         present_family,
                                  bool             vsync,
                                  VkSwapchainKHR   old_swapchain     = VK_NULL_HANDLE,
                                  VkRenderPass     reuse_render_pass = VK_NULL_HANDLE);

void destroy_swapchain(VkDevice device, SwapchainContext& ctx, bool skip_render_pass = false);

}   // namespace tlviz::vk

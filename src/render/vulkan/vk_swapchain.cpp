#include "vk_swapchain.hpp"

#include <algorithm>
#include <stdexcept>
#include <tlviz/logger.hpp>

namespace tlviz::vk
{

SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    SwapchainSupportDetails details;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface, &details.capabilities);

    uint32_t format_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &format_count, nullptr);
    if (format_count > 0)
    {
        details.formats.resize(format_count);
        vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &format_count, details.formats.data());
    }

    uint32_t mode_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &mode_count, nullptr);
    if (mode_count > 0)
    {
        details.present_modes.resize(mode_count);
        vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &mode_count,
                                                  details.present_modes.data());
    }

    return details;
}

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats)
{
    for (const auto& f : formats)
    {
        if ((f.format == VK_FORMAT_B8G8R8A8_UNORM || f.format == VK_FORMAT_R8G8B8A8_UNORM)
            && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
        {
            return f;
        }
    }
    return formats[0];
}

VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR>& modes, bool vsync)
{
    if (vsync)
        return VK_PRESENT_MODE_FIFO_KHR;

    for (VkPresentModeKHR preferred : {VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR})
    {
        if (std::find(modes.begin(), modes.end(), preferred) != modes.end())
            return preferred;
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& capabilities, uint32_t width, uint32_t height)
{
    if (capabilities.currentExtent.width != UINT32_MAX)
        return capabilities.currentExtent;

    VkExtent2D extent = {width, height};
    extent.width =
        std::clamp(extent.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width);
    extent.height = std::clamp(extent.height, capabilities.minImageExtent.height,
                               capabilities.maxImageExtent.height);
    return extent;
}

VkRenderPass create_render_pass(VkDevice device, VkFormat color_format)
{
    VkAttachmentDescription color_attachment{};
    color_attachment.format         = color_format;
    color_attachment.samples        = VK_SAMPLE_COUNT_1_BIT;
    color_attachment.loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color_attachment.storeOp        = VK_ATTACHMENT_STORE_OP_STORE;
    color_attachment.stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color_attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color_attachment.initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    color_attachment.finalLayout    = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference color_ref{};
    color_ref.attachment = 0;
    color_ref.layout     = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint    = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments    = &color_ref;

    VkSubpassDependency dependency{};
    dependency.srcSubpass    = VK_SUBPASS_EXTERNAL;
    dependency.dstSubpass    = 0;
    dependency.srcStageMask  = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.srcAccessMask = 0;
    dependency.dstStageMask  = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    info.attachmentCount = 1;
    info.pAttachments    = &color_attachment;
    info.subpassCount    = 1;
    info.pSubpasses      = &subpass;
    info.dependencyCount = 1;
    info.pDependencies   = &dependency;

    VkRenderPass render_pass = VK_NULL_HANDLE;
    if (vkCreateRenderPass(device, &info, nullptr, &render_pass) != VK_SUCCESS)
        throw std::runtime_error("Failed to create render pass");
    return render_pass;
}

SwapchainContext create_swapchain(VkDevice         device,
                                  VkPhysicalDevice physical_device,
                                  VkSurfaceKHR     surface,
                                  uint32_t         width,
                                  uint32_t         height,
                                  uint32_t         graphics_family,
                                  uint32_t         present_family,
                                  bool             vsync,
                                  VkSwapchainKHR   old_swapchain,
                                  VkRenderPass     reuse_render_pass)
{
    auto support = query_swapchain_support(physical_device, surface);
    if (support.formats.empty())
        throw std::runtime_error("Window surface offers no image formats");

    auto surface_format = choose_surface_format(support.formats);
    auto present_mode   = choose_present_mode(support.present_modes, vsync);
    auto extent         = choose_extent(support.capabilities, width, height);

    uint32_t image_count = support.capabilities.minImageCount + 1;
    if (support.capabilities.maxImageCount > 0 && image_count > support.capabilities.maxImageCount)
        image_count = support.capabilities.maxImageCount;

    VkSwapchainCreateInfoKHR info{};
    info.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    info.surface          = surface;
    info.minImageCount    = image_count;
    info.imageFormat      = surface_format.format;
    info.imageColorSpace  = surface_format.colorSpace;
    info.imageExtent      = extent;
    info.imageArrayLayers = 1;
    info.imageUsage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

    uint32_t families[] = {graphics_family, present_family};
    if (graphics_family != present_family)
    {
        info.imageSharingMode      = VK_SHARING_MODE_CONCURRENT;
        info.queueFamilyIndexCount = 2;
        info.pQueueFamilyIndices   = families;
    }
    else
    {
        info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    info.preTransform   = support.capabilities.currentTransform;
    info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    info.presentMode    = present_mode;
    info.clipped        = VK_TRUE;
    info.oldSwapchain   = old_swapchain;

    SwapchainContext ctx;
    ctx.image_format    = surface_format.format;
    ctx.extent          = extent;
    ctx.min_image_count = image_count;

    if (vkCreateSwapchainKHR(device, &info, nullptr, &ctx.swapchain) != VK_SUCCESS)
        throw std::runtime_error("Failed to create swapchain");

    uint32_t actual_count = 0;
    vkGetSwapchainImagesKHR(device, ctx.swapchain, &actual_count, nullptr);
    ctx.images.resize(actual_count);
    vkGetSwapchainImagesKHR(device, ctx.swapchain, &actual_count, ctx.images.data());

    ctx.image_views.resize(actual_count);
    for (uint32_t i = 0; i < actual_count; ++i)
    {
        VkImageViewCreateInfo view_info{};
        view_info.sType                           = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        view_info.image                           = ctx.images[i];
        view_info.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
        view_info.format                          = ctx.image_format;
        view_info.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
        view_info.subresourceRange.baseMipLevel   = 0;
        view_info.subresourceRange.levelCount     = 1;
        view_info.subresourceRange.baseArrayLayer = 0;
        view_info.subresourceRange.layerCount     = 1;

        if (vkCreateImageView(device, &view_info, nullptr, &ctx.image_views[i]) != VK_SUCCESS)
            throw std::runtime_error("Failed to create swapchain image view");
    }

    ctx.render_pass = reuse_render_pass != VK_NULL_HANDLE
                          ? reuse_render_pass
                          : create_render_pass(device, ctx.image_format);

    ctx.framebuffers.resize(actual_count);
    for (uint32_t i = 0; i < actual_count; ++i)
    {
        VkFramebufferCreateInfo fb_info{};
        fb_info.sType           = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        fb_info.renderPass      = ctx.render_pass;
        fb_info.attachmentCount = 1;
        fb_info.pAttachments    = &ctx.image_views[i];
        fb_info.width           = extent.width;
        fb_info.height          = extent.height;
        fb_info.layers          = 1;

        if (vkCreateFramebuffer(device, &fb_info, nullptr, &ctx.framebuffers[i]) != VK_SUCCESS)
            throw std::runtime_error("Failed to create framebuffer");
    }

    TLVIZ_LOG_DEBUG("vulkan", "Swapchain {}x{}, {} images", extent.width, extent.height, actual_count);
    return ctx;
}

void destroy_swapchain(VkDevice device, SwapchainContext& ctx, bool skip_render_pass)
{
    for (auto fb : ctx.framebuffers)
        vkDestroyFramebuffer(device, fb, nullptr);
    ctx.framebuffers.clear();

    if (!skip_render_pass && ctx.render_pass != VK_NULL_HANDLE)
    {
        vkDestroyRenderPass(device, ctx.render_pass, nullptr);
        ctx.render_pass = VK_NULL_HANDLE;
    }

    for (auto view : ctx.image_views)
        vkDestroyImageView(device, view, nullptr);
    ctx.image_views.clear();
    ctx.images.clear();

    if (ctx.swapchain != VK_NULL_HANDLE)
    {
        vkDestroySwapchainKHR(device, ctx.swapchain, nullptr);
        ctx.swapchain = VK_NULL_HANDLE;
    }
}

}   // namespace tlviz::vk

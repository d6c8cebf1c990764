#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

namespace tlviz::vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool is_complete() const { return graphics.has_value() && present.has_value(); }
};

struct DeviceContext
{
    VkInstance               instance        = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger = VK_NULL_HANDLE;
    VkPhysicalDevice         physical_device = VK_NULL_HANDLE;
    VkDevice                 device          = VK_NULL_HANDLE;
    VkQueue                  graphics_queue  = VK_NULL_HANDLE;
    VkQueue                  present_queue   = VK_NULL_HANDLE;
    QueueFamilyIndices       queue_families;
};

// Requires glfwInit() to have succeeded: window-system extensions come from GLFW.
VkInstance create_instance(bool enable_validation);

VkDebugUtilsMessengerEXT create_debug_messenger(VkInstance instance);
void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger);

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface);

// Prefers discrete GPUs. Throws std::runtime_error if none can present to surface.
VkPhysicalDevice pick_physical_device(VkInstance instance, VkSurfaceKHR surface);

VkDevice create_logical_device(VkPhysicalDevice          physical_device,
                               const QueueFamilyIndices& indices,
                               bool                      enable_validation);

bool check_validation_layer_support();

}   // namespace tlviz::vk

#include "glfw_adapter.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <stdexcept>
#include <tlviz/logger.hpp>

namespace tlviz
{

namespace
{

void error_callback(int code, const char* description)
{
    TLVIZ_LOG_ERROR("glfw", "GLFW error {}: {}", code, description);
}

GlfwAdapter* adapter_for(GLFWwindow* window)
{
    return static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
}

}   // anonymous namespace

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

void GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    glfwSetErrorCallback(error_callback);

    if (!glfwInit())
        throw std::runtime_error("Failed to initialize GLFW");
    initialized_ = true;

    if (!glfwVulkanSupported())
        throw std::runtime_error("GLFW: Vulkan not supported");

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(static_cast<int>(width), static_cast<int>(height), title.c_str(),
                               nullptr, nullptr);
    if (!window_)
        throw std::runtime_error("Failed to create GLFW window");

    glfwSetWindowUserPointer(window_, this);

    glfwSetCursorPosCallback(window_, cursor_pos_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    glfwSetScrollCallback(window_, scroll_callback);
    glfwSetCursorEnterCallback(window_, cursor_enter_callback);
    glfwSetFramebufferSizeCallback(window_, framebuffer_size_callback);
    glfwSetKeyCallback(window_, key_callback);

    TLVIZ_LOG_INFO("glfw", "Window '{}' created ({}x{})", title, width, height);
}

void GlfwAdapter::shutdown()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (initialized_)
    {
        glfwTerminate();
        initialized_ = false;
    }
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

void GlfwAdapter::wait_events()
{
    glfwWaitEvents();
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    int w = 0, h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, &h);
    width  = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
}

void GlfwAdapter::set_callbacks(const InputCallbacks& callbacks)
{
    callbacks_ = callbacks;
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwAdapter::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_mouse_move)
        adapter->callbacks_.on_mouse_move(x, y);
}

void GlfwAdapter::mouse_button_callback(GLFWwindow* window, int button, int action, int mods)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_mouse_button)
    {
        double x, y;
        glfwGetCursorPos(window, &x, &y);
        adapter->callbacks_.on_mouse_button(button, action, mods, x, y);
    }
}

void GlfwAdapter::scroll_callback(GLFWwindow* window, double x_offset, double y_offset)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_scroll)
        adapter->callbacks_.on_scroll(x_offset, y_offset);
}

void GlfwAdapter::cursor_enter_callback(GLFWwindow* window, int entered)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_cursor_enter)
        adapter->callbacks_.on_cursor_enter(entered == GLFW_TRUE);
}

void GlfwAdapter::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_resize)
        adapter->callbacks_.on_resize(width, height);
}

void GlfwAdapter::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    auto* adapter = adapter_for(window);
    if (adapter && adapter->callbacks_.on_key)
        adapter->callbacks_.on_key(key, action, mods);
}

}   // namespace tlviz

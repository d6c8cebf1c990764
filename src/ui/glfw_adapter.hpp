#pragma once

#include <cstdint>
#include <functional>
#include <string>

struct GLFWwindow;

namespace tlviz
{

// Callback types for window input events, in GLFW units.
struct InputCallbacks
{
    std::function<void(double x, double y)>                                   on_mouse_move;
    std::function<void(int button, int action, int mods, double x, double y)> on_mouse_button;
    std::function<void(double x_offset, double y_offset)>                     on_scroll;
    std::function<void(bool entered)>                                         on_cursor_enter;
    std::function<void(int width, int height)>                                on_resize;
    std::function<void(int key, int action, int mods)>                        on_key;
};

class GlfwAdapter
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    // Initialize GLFW and create a window without a client API (Vulkan).
    // Throws std::runtime_error on failure.
    void init(uint32_t width, uint32_t height, const std::string& title);

    // Destroy the window and terminate GLFW.
    void shutdown();

    void poll_events();

    // Blocks until an event arrives (used while minimized)
    void wait_events();

    bool should_close() const;

    GLFWwindow* window() const { return window_; }

    void framebuffer_size(uint32_t& width, uint32_t& height) const;

    // Must be set before ImGui installs its own callbacks so that ImGui
    // chains to these.
    void set_callbacks(const InputCallbacks& callbacks);

   private:
    GLFWwindow*    window_      = nullptr;
    bool           initialized_ = false;
    InputCallbacks callbacks_;

    // Static callback trampolines (GLFW uses C callbacks)
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void scroll_callback(GLFWwindow* window, double x_offset, double y_offset);
    static void cursor_enter_callback(GLFWwindow* window, int entered);
    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
};

}   // namespace tlviz

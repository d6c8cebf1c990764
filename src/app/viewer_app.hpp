#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tlviz/config.hpp>
#include <tlviz/logger.hpp>
#include <tlviz/surface.hpp>
#include <tlviz/visualizer.hpp>

namespace tlviz
{

class FrameScheduler;
class GlfwAdapter;
class ImGuiSurface;

namespace vk
{
class VulkanPresenter;
}

struct ViewerConfig
{
    uint32_t    width      = 1280;
    uint32_t    height     = 480;
    std::string title      = "tlviz";
    float       target_fps = 60.0f;
    bool        vsync      = true;
    bool        validation = false;
    LogLevel    log_level  = LogLevel::Info;

    // JSON VisualizerConfig to load; defaults are used when empty.
    std::optional<std::string> config_path;
    // Applied when config_path is empty.
    VisualizerConfig visualizer;
};

// Desktop host for one TimelineVisualizer: a GLFW window presented through
// Vulkan, with the visualizer painting into ImGui's background draw list.
//
//   ViewerApp app(resolver, cfg);
//   app.init();
//   app.visualizer().set_timeline(objects, opts);
//   return app.run();
class ViewerApp
{
   public:
    // Called once per frame before rendering, with the seconds since start.
    using FrameCallback = std::function<void(TimelineVisualizer&, double elapsed)>;

    ViewerApp(Resolver& resolver, ViewerConfig config = {});
    ~ViewerApp();

    ViewerApp(const ViewerApp&)            = delete;
    ViewerApp& operator=(const ViewerApp&) = delete;

    // Opens the window and creates the visualizer. Throws std::runtime_error
    // on window/GPU failure, std::invalid_argument on a bad config.
    void init();

    // Runs until the window closes. Returns the process exit code.
    int run();

    void set_on_frame(FrameCallback cb) { on_frame_ = std::move(cb); }

    TimelineVisualizer& visualizer();

   private:
    Resolver&     resolver_;
    ViewerConfig  config_;
    FrameCallback on_frame_;

    std::unique_ptr<GlfwAdapter>         window_;
    std::unique_ptr<vk::VulkanPresenter> presenter_;
    std::unique_ptr<FrameScheduler>      scheduler_;
    std::unique_ptr<ImGuiSurface>        surface_;
    SurfaceRegistry                      surfaces_;
    std::unique_ptr<TimelineVisualizer>  visualizer_;
    bool                                 imgui_initialized_ = false;
    double                               cursor_x_          = 0.0;
    double                               cursor_y_          = 0.0;

    void install_input_callbacks();
    void draw_frame();
    void draw_hover_tooltip();
    void shutdown();
};

}   // namespace tlviz

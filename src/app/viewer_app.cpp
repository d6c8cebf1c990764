#include "viewer_app.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <cstdio>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <stdexcept>

#include "anim/frame_scheduler.hpp"
#include "render/style.hpp"
#include "render/vulkan/vk_presenter.hpp"
#include "ui/glfw_adapter.hpp"
#include "ui/imgui_surface.hpp"

namespace tlviz
{

namespace
{

constexpr const char* SURFACE_ID = "viewer";

// GLFW reports wheel notches with up/left positive; the visualizer takes
// pixel deltas with down/right positive.
constexpr double SCROLL_PIXELS_PER_NOTCH = 100.0;

std::string format_time(std::optional<double> t)
{
    if (!t)
        return "open";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", *t);
    return buf;
}

}   // anonymous namespace

ViewerApp::ViewerApp(Resolver& resolver, ViewerConfig config)
    : resolver_(resolver), config_(std::move(config))
{
}

ViewerApp::~ViewerApp()
{
    shutdown();
}

TimelineVisualizer& ViewerApp::visualizer()
{
    if (!visualizer_)
        throw std::runtime_error("ViewerApp::visualizer() called before init()");
    return *visualizer_;
}

// ─── Setup ──────────────────────────────────────────────────────────────────

void ViewerApp::init()
{
    auto& logger = Logger::instance();
    logger.set_level(config_.log_level);
    if (logger.sink_count() == 0)
        logger.add_sink(sinks::console_sink());

    VisualizerConfig vis_config =
        config_.config_path ? load_config(*config_.config_path) : config_.visualizer;

    window_ = std::make_unique<GlfwAdapter>();
    window_->init(config_.width, config_.height, config_.title);

    int win_w = 0, win_h = 0;
    glfwGetWindowSize(window_->window(), &win_w, &win_h);

    surface_ = std::make_unique<ImGuiSurface>();
    surface_->set_size(static_cast<float>(win_w), static_cast<float>(win_h));
    surfaces_.register_surface(SURFACE_ID, surface_.get());

    visualizer_ = std::make_unique<TimelineVisualizer>(surfaces_, SURFACE_ID, resolver_, vis_config);

    // Before ImGui: its GLFW backend chains to callbacks already installed.
    install_input_callbacks();

    presenter_ = std::make_unique<vk::VulkanPresenter>();
    presenter_->init(window_->window(), config_.vsync, config_.validation);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();
    imgui_initialized_ = true;

    ImGui_ImplGlfw_InitForVulkan(window_->window(), true);
    presenter_->init_imgui();

    scheduler_ = std::make_unique<FrameScheduler>(
        config_.target_fps, config_.vsync ? FrameScheduler::Mode::VSync : FrameScheduler::Mode::TargetFPS);

    TLVIZ_LOG_INFO("visualizer", "Viewer initialized ({}x{})", config_.width, config_.height);
}

void ViewerApp::install_input_callbacks()
{
    InputCallbacks cb;

    cb.on_mouse_move = [this](double x, double y)
    {
        cursor_x_ = x;
        cursor_y_ = y;
        visualizer_->on_mouse_move(x, y);
    };

    cb.on_mouse_button = [this](int button, int action, int mods, double x, double y)
    { visualizer_->on_mouse_button(button, action, mods, x, y); };

    cb.on_scroll = [this](double x_offset, double y_offset)
    {
        visualizer_->on_scroll(-x_offset * SCROLL_PIXELS_PER_NOTCH, -y_offset * SCROLL_PIXELS_PER_NOTCH,
                               cursor_x_, cursor_y_);
    };

    cb.on_cursor_enter = [this](bool entered)
    {
        if (!entered)
            visualizer_->on_mouse_leave();
    };

    cb.on_resize = [this](int width, int height)
    {
        if (presenter_)
            presenter_->on_resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    };

    cb.on_key = [this](int key, int action, int mods)
    {
        if (visualizer_->on_key(key, action, mods) || action != GLFW_PRESS)
            return;

        // Space toggles playhead playback, P toggles viewport auto-scroll.
        ViewportRequest req;
        if (key == GLFW_KEY_SPACE && visualizer_->playhead_enabled())
            req.play_playhead = !visualizer_->playhead_playing();
        else if (key == GLFW_KEY_P)
            req.play_viewport = !visualizer_->viewport_playing();
        else
            return;
        visualizer_->set_viewport(req);
    };

    window_->set_callbacks(cb);
}

// ─── Loop ───────────────────────────────────────────────────────────────────

int ViewerApp::run()
{
    if (!visualizer_)
        init();

    while (!window_->should_close())
    {
        window_->poll_events();

        uint32_t fb_w = 0, fb_h = 0;
        window_->framebuffer_size(fb_w, fb_h);
        if (fb_w == 0 || fb_h == 0)
        {
            // Minimized
            window_->wait_events();
            scheduler_->reset();
            continue;
        }

        scheduler_->begin_frame();
        draw_frame();
        scheduler_->end_frame();
    }

    TLVIZ_LOG_INFO("visualizer", "Viewer closed after {} frames, {} hitches", scheduler_->frame_number(),
                   scheduler_->hitch_count());
    shutdown();
    return 0;
}

void ViewerApp::draw_frame()
{
    if (!presenter_->begin_frame(style::BACKGROUND))
        return;

    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    ImGuiIO& io = ImGui::GetIO();
    if (surface_->set_size(io.DisplaySize.x, io.DisplaySize.y))
        visualizer_->resize();

    if (on_frame_)
        on_frame_(*visualizer_, scheduler_->elapsed_seconds());

    visualizer_->update_draw();

    surface_->begin(ImGui::GetBackgroundDrawList(), 0.0f, 0.0f);
    visualizer_->render();
    surface_->end();

    draw_hover_tooltip();

    ImGui::Render();
    presenter_->end_frame();
}

void ViewerApp::draw_hover_tooltip()
{
    const auto& hovered = visualizer_->hovered_object();
    if (!hovered)
        return;

    ImGui::BeginTooltip();
    ImGui::Text("%s", hovered->object.id().c_str());
    ImGui::Separator();
    ImGui::Text("Layer:    %s", hovered->object.layer().c_str());
    ImGui::Text("Instance: %s", hovered->instance.id.c_str());
    ImGui::Text("Start:    %s", format_time(hovered->instance.start).c_str());
    ImGui::Text("End:      %s", format_time(hovered->instance.end).c_str());
    ImGui::EndTooltip();
}

void ViewerApp::shutdown()
{
    if (presenter_)
    {
        presenter_->shutdown_imgui();
        if (imgui_initialized_)
        {
            ImGui_ImplGlfw_Shutdown();
            ImGui::DestroyContext();
            imgui_initialized_ = false;
        }
        presenter_->shutdown();
        presenter_.reset();
    }

    visualizer_.reset();
    surfaces_.unregister_surface(SURFACE_ID);
    surface_.reset();

    if (window_)
    {
        window_->shutdown();
        window_.reset();
    }
}

}   // namespace tlviz

#pragma once

#include <functional>
#include <tlviz/config.hpp>

namespace tlviz
{

class ViewportController;

// Interaction state for the input handler (dragging state)
enum class InteractionMode
{
    Idle,
    Dragging,   // left button held, horizontal drag pans
};

// Called after a gesture moved the viewport.
using ViewportChangedCallback = std::function<void()>;
// Called on every pointer move with the surface-relative position.
using PointerMoveCallback = std::function<void(double x, double y)>;

// Input handler: maps mouse/wheel/keyboard events to viewport pan and zoom.
// Event codes follow GLFW. Wheel deltas follow the browser convention:
// positive delta_y scrolls down (zooms out with ctrl held).
class InputHandler
{
   public:
    InputHandler(ViewportController& viewport, const VisualizerConfig& config);
    ~InputHandler();

    void set_on_viewport_changed(ViewportChangedCallback cb) { on_viewport_changed_ = std::move(cb); }
    void set_on_pointer_move(PointerMoveCallback cb) { on_pointer_move_ = std::move(cb); }

    // Each returns true if the event was consumed.

    // Left press starts a drag, release ends it.
    bool on_mouse_button(int button, int action, int mods, double x, double y);

    // Pan if dragging; always reports the position for hover testing.
    bool on_mouse_move(double x, double y);

    // Ctrl+wheel zooms about the cursor, horizontal wheel pans, alt+wheel
    // pans with the vertical delta. Ignored left of the time area.
    bool on_scroll(double delta_x, double delta_y, double cursor_x, double cursor_y);

    // Key event: modifier tracking
    bool on_key(int key, int action, int mods);

    InteractionMode mode() const { return mode_; }
    int             mods() const { return mods_; }

    // GLFW constants (to avoid including GLFW in header)
    static constexpr int MOUSE_BUTTON_LEFT = 0;
    static constexpr int ACTION_RELEASE    = 0;
    static constexpr int ACTION_PRESS      = 1;
    static constexpr int ACTION_REPEAT     = 2;
    static constexpr int MOD_SHIFT         = 0x0001;
    static constexpr int MOD_CONTROL       = 0x0002;
    static constexpr int MOD_ALT           = 0x0004;

    static constexpr int KEY_LEFT_SHIFT    = 340;
    static constexpr int KEY_LEFT_CONTROL  = 341;
    static constexpr int KEY_LEFT_ALT      = 342;
    static constexpr int KEY_RIGHT_SHIFT   = 344;
    static constexpr int KEY_RIGHT_CONTROL = 345;
    static constexpr int KEY_RIGHT_ALT     = 346;

   private:
    ViewportController&     viewport_;
    const VisualizerConfig& config_;

    ViewportChangedCallback on_viewport_changed_;
    PointerMoveCallback     on_pointer_move_;

    InteractionMode mode_ = InteractionMode::Idle;

    // Pan drag state. direction is -1 (left), +1 (right) or 0 (not yet known).
    double last_x_         = 0.0;
    int    drag_direction_ = 0;

    // Modifier key tracking (updated from on_key and on_mouse_button)
    int mods_ = 0;

    void pan(double dx);
};

}   // namespace tlviz

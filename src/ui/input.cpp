#include "input.hpp"

#include <tlviz/logger.hpp>

#include "core/viewport_controller.hpp"

namespace tlviz
{

namespace
{

int modifier_bit(int key)
{
    switch (key)
    {
        case InputHandler::KEY_LEFT_SHIFT:
        case InputHandler::KEY_RIGHT_SHIFT:
            return InputHandler::MOD_SHIFT;
        case InputHandler::KEY_LEFT_CONTROL:
        case InputHandler::KEY_RIGHT_CONTROL:
            return InputHandler::MOD_CONTROL;
        case InputHandler::KEY_LEFT_ALT:
        case InputHandler::KEY_RIGHT_ALT:
            return InputHandler::MOD_ALT;
        default:
            return 0;
    }
}

}   // anonymous namespace

// ─── Constructor / Destructor ────────────────────────────────────────────────

InputHandler::InputHandler(ViewportController& viewport, const VisualizerConfig& config)
    : viewport_(viewport), config_(config)
{
}

InputHandler::~InputHandler() = default;

void InputHandler::pan(double dx)
{
    if (viewport_.pan_by_pixels(dx) && on_viewport_changed_)
        on_viewport_changed_();
}

// ─── Mouse button ───────────────────────────────────────────────────────────

bool InputHandler::on_mouse_button(int button, int action, int mods, double x, double /*y*/)
{
    // Update modifier state from the authoritative GLFW mods bitmask
    mods_ = mods;

    if (button != MOUSE_BUTTON_LEFT)
        return false;

    if (action == ACTION_PRESS)
    {
        mode_           = InteractionMode::Dragging;
        last_x_         = x;
        drag_direction_ = 0;
        return true;
    }

    if (action == ACTION_RELEASE)
    {
        mode_           = InteractionMode::Idle;
        drag_direction_ = 0;
        return true;
    }

    return false;
}

// ─── Mouse move ─────────────────────────────────────────────────────────────

bool InputHandler::on_mouse_move(double x, double y)
{
    if (on_pointer_move_)
        on_pointer_move_(x, y);

    if (mode_ != InteractionMode::Dragging)
        return false;

    double dx = x - last_x_;
    if (dx == 0.0)
        return true;

    int direction = dx < 0.0 ? -1 : 1;
    if (drag_direction_ != 0 && direction != drag_direction_)
    {
        // Direction reversed: re-anchor without scrolling.
        drag_direction_ = direction;
        last_x_         = x;
        return true;
    }

    drag_direction_ = direction;
    last_x_         = x;
    pan(-dx);
    return true;
}

// ─── Scroll ─────────────────────────────────────────────────────────────────

bool InputHandler::on_scroll(double delta_x, double delta_y, double cursor_x, double /*cursor_y*/)
{
    if (cursor_x <= viewport_.timeline_start())
        return false;

    double pan_step = config_.pan_factor * config_.step_size;

    if (mods_ & MOD_CONTROL)
    {
        if (viewport_.zoom_about_cursor(cursor_x, delta_y))
        {
            TLVIZ_LOG_DEBUG("viewport", "Wheel zoom to {}", viewport_.zoom());
            if (on_viewport_changed_)
                on_viewport_changed_();
        }
    }
    else if (delta_x != 0.0)
    {
        pan(delta_x * pan_step);
    }
    else if (delta_y != 0.0 && (mods_ & MOD_ALT))
    {
        pan(delta_y * pan_step);
    }

    return true;
}

// ─── Keyboard ───────────────────────────────────────────────────────────────

bool InputHandler::on_key(int key, int action, int mods)
{
    // Track modifier state for use in scroll callbacks
    mods_ = mods;

    // GLFW may still report a modifier as held in its own release event
    int bit = modifier_bit(key);
    if (bit != 0)
    {
        if (action == ACTION_RELEASE)
            mods_ &= ~bit;
        else
            mods_ |= bit;
    }

    return false;
}

}   // namespace tlviz

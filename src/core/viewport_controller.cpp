#include "viewport_controller.hpp"

#include <cmath>
#include <tlviz/logger.hpp>

#include "coord_mapper.hpp"

namespace tlviz
{

ViewportController::ViewportController(const VisualizerConfig& config)
    : config_(config),
      zoom_(config.default_zoom),
      draw_time_range_(config.default_draw_range * config.step_size)
{
    update_scaled_range();
    set_window_start(0.0);
}

void ViewportController::set_canvas_width(double width)
{
    canvas_width_   = width > 0.0 ? width : 1.0;
    timeline_start_ = canvas_width_ * config_.label_width_fraction;
    timeline_width_ = canvas_width_ - timeline_start_;
}

ViewportSnapshot ViewportController::snapshot() const
{
    ViewportSnapshot vp;
    vp.draw_time_start = draw_time_start_;
    vp.draw_time_end   = draw_time_end_;
    vp.timeline_start  = timeline_start_;
    vp.timeline_width  = timeline_width_;
    vp.canvas_width    = canvas_width_;
    return vp;
}

void ViewportController::update_scaled_range()
{
    scaled_draw_time_range_ = draw_time_range_ * (zoom_ / 100.0);
}

void ViewportController::set_window_start(double start)
{
    draw_time_start_ = start < 0.0 ? 0.0 : start;
    draw_time_end_   = draw_time_start_ + scaled_draw_time_range_;
}

bool ViewportController::pan_by_pixels(double dx)
{
    double ppu          = snapshot().pixels_per_unit_time();
    double target_start = draw_time_start_ + dx / ppu;
    if (target_start < 0.0)
        target_start = 0.0;

    if (target_start == draw_time_start_)
        return false;

    double width     = draw_time_end_ - draw_time_start_;
    draw_time_start_ = target_start;
    draw_time_end_   = target_start + width;
    TLVIZ_LOG_TRACE("viewport", "Pan to [{}, {})", draw_time_start_, draw_time_end_);
    return true;
}

bool ViewportController::zoom_about_cursor(double x, double wheel_delta)
{
    if (wheel_delta == 0.0)
        return false;

    ViewportSnapshot vp     = snapshot();
    double           cursor = x_to_time(vp, x);
    double           ratio  = x_ratio(vp, x);
    if (cursor == NOT_OVER_TIMELINE)
        return false;

    double scale = std::pow(config_.zoom_factor, std::abs(wheel_delta));
    if (wheel_delta > 0.0)
        zoom_ *= scale;
    else
        zoom_ /= scale;
    update_scaled_range();

    double target_start = cursor - ratio * scaled_draw_time_range_;
    double target_end   = target_start + scaled_draw_time_range_;
    if (target_start < 0.0)
    {
        target_end -= target_start;
        target_start = 0.0;
    }

    draw_time_start_ = target_start;
    draw_time_end_   = target_end;
    TLVIZ_LOG_TRACE("viewport", "Zoom {} about t={}", zoom_, cursor);
    return true;
}

void ViewportController::set_zoom(double zoom)
{
    zoom_ = zoom;
    update_scaled_range();
    draw_time_end_ = draw_time_start_ + scaled_draw_time_range_;
}

void ViewportController::jump_to(double timestamp)
{
    double width     = draw_time_end_ - draw_time_start_;
    draw_time_start_ = timestamp < 0.0 ? 0.0 : timestamp;
    draw_time_end_   = draw_time_start_ + width;
}

bool ViewportController::scroll_by_time(double delta)
{
    if (delta == 0.0)
        return false;

    double width = draw_time_end_ - draw_time_start_;
    double start = draw_time_start_ + delta;
    if (start < 0.0)
        start = 0.0;
    if (start == draw_time_start_)
        return false;

    draw_time_start_ = start;
    draw_time_end_   = start + width;
    return true;
}

void ViewportController::reset_window(double start)
{
    draw_time_range_ = config_.default_draw_range * config_.step_size;
    update_scaled_range();
    set_window_start(start);
}

}   // namespace tlviz

#pragma once

#include <tlviz/config.hpp>
#include <tlviz/geometry.hpp>

namespace tlviz
{

// Owns the visible time window [start, end) and the zoom level, plus the
// horizontal canvas layout (label column, time area) they map onto.
//
// Invariants: draw_time_start() >= 0 and draw_time_end() > draw_time_start().
class ViewportController
{
   public:
    explicit ViewportController(const VisualizerConfig& config);

    // Recompute the label column and time area for a new canvas width.
    void set_canvas_width(double width);

    double draw_time_start() const { return draw_time_start_; }
    double draw_time_end() const { return draw_time_end_; }
    double zoom() const { return zoom_; }
    double draw_time_range() const { return draw_time_range_; }
    double scaled_draw_time_range() const { return scaled_draw_time_range_; }

    double canvas_width() const { return canvas_width_; }
    double timeline_start() const { return timeline_start_; }
    double timeline_width() const { return timeline_width_; }
    double label_width() const { return timeline_start_; }

    ViewportSnapshot snapshot() const;

    // ─── Gestures ───────────────────────────────────────────────────────

    // Shift the window by dx pixels' worth of time, never before 0.
    // Returns false if the window did not move.
    bool pan_by_pixels(double dx);

    // Scale zoom by zoom_factor^|wheel_delta| (positive delta zooms out)
    // keeping the time under x fixed. Returns false if x is not over the
    // time area or the delta is zero.
    bool zoom_about_cursor(double x, double wheel_delta);

    // ─── Absolute changes ───────────────────────────────────────────────

    // Set the zoom percentage and re-derive the window end from its start.
    void set_zoom(double zoom);

    // Move the window start to timestamp (clamped to >= 0), keeping width.
    void jump_to(double timestamp);

    // Auto-play step: shift both edges by delta time units.
    bool scroll_by_time(double delta);

    // Default range at the current zoom, starting at start.
    void reset_window(double start);

   private:
    const VisualizerConfig& config_;

    double draw_time_start_        = 0.0;
    double draw_time_end_          = 0.0;
    double zoom_                   = 100.0;
    double draw_time_range_        = 0.0;
    double scaled_draw_time_range_ = 0.0;

    double canvas_width_   = 1.0;
    double timeline_start_ = 0.0;
    double timeline_width_ = 1.0;

    void update_scaled_range();
    void set_window_start(double start);
};

}   // namespace tlviz

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tlviz/config.hpp>
#include <tlviz/geometry.hpp>
#include <tlviz/surface.hpp>
#include <tlviz/timeline.hpp>
#include <vector>

namespace tlviz
{

class HoverIndex;
class InputHandler;
class PlayheadLoop;
class ViewportController;

// Absolute viewport change. Every field is optional and applied on its own.
struct ViewportRequest
{
    // Move the window start to this time (clamped to >= 0).
    std::optional<double> timestamp;
    // Zoom percentage, 100 = default range.
    std::optional<double> zoom;
    // The following require VisualizerConfig::draw_playhead.
    std::optional<bool>   play_playhead;
    std::optional<double> playhead_time;
    std::optional<double> play_speed;
    // Scroll the window itself at play speed.
    std::optional<bool> play_viewport;
};

struct PointerPosition
{
    double x = 0.0;
    double y = 0.0;
};

struct HoveredObject
{
    ResolvedTimelineObject object;
    Instance               instance;
    PointerPosition        pointer;
};

// Receives each hover transition; empty on hover-clear.
using HoverCallback = std::function<void(const std::optional<HoveredObject>&)>;

// A resolved schedule kept for display, tagged with its generation.
struct RetainedSchedule
{
    uint64_t         generation = 0;
    ResolvedTimeline timeline;
};

// TimelineVisualizer — zoomable, pannable view of resolved timeline
// schedules on one drawing surface.
//
// Owns the retained schedules, the viewport, the playhead and the hover
// state. Drawing state is derived from scratch on every redraw and cached
// until the next one; render() paints the cache and may be called every
// frame. Single-threaded: all calls must come from the host's UI thread.
class TimelineVisualizer
{
   public:
    using Clock = std::chrono::steady_clock;

    // Throws std::runtime_error if no surface is registered under
    // surface_id, std::invalid_argument if config fails validation.
    TimelineVisualizer(SurfaceRegistry&        surfaces,
                       const std::string&      surface_id,
                       Resolver&               resolver,
                       const VisualizerConfig& config = {});
    ~TimelineVisualizer();

    TimelineVisualizer(const TimelineVisualizer&)            = delete;
    TimelineVisualizer& operator=(const TimelineVisualizer&) = delete;

    // ─── Schedules ──────────────────────────────────────────────────────

    // Resolve and display objects, discarding previously held schedules.
    void set_timeline(const std::vector<TimelineObject>& objects, const ResolveOptions& options);

    // Re-resolve an updated object list. With the playhead enabled the new
    // schedule is resolved at the playhead and stitched onto the previous
    // one; otherwise it replaces the newest schedule.
    void update_timeline(const std::vector<TimelineObject>& objects,
                         std::optional<ResolveOptions>      options = std::nullopt);

    const std::vector<RetainedSchedule>& schedules() const { return schedules_; }

    // ─── Viewport ───────────────────────────────────────────────────────

    // Throws std::invalid_argument (without changing anything) when a
    // playhead field is set but the playhead is disabled, or zoom <= 0.
    void set_viewport(const ViewportRequest& request);

    double draw_time_start() const;
    double draw_time_end() const;
    double zoom() const;
    ViewportSnapshot viewport() const;

    // Re-read the surface size and recompute all geometry.
    void resize();

    // ─── Playhead ───────────────────────────────────────────────────────

    bool   playhead_enabled() const { return config_.draw_playhead; }
    double playhead_time() const;
    double playhead_position() const;
    bool   playhead_playing() const;
    bool   viewport_playing() const;
    double play_speed() const;

    // Per-frame step: advance playhead/auto-scroll by wall-clock time.
    void update_draw();
    void update_draw_at(Clock::time_point now);

    // ─── Input ──────────────────────────────────────────────────────────
    // GLFW-compatible codes. Each returns true if the event was consumed
    // and the host should suppress its default handling.

    bool on_mouse_button(int button, int action, int mods, double x, double y);
    bool on_mouse_move(double x, double y);
    bool on_scroll(double delta_x, double delta_y, double cursor_x, double cursor_y);
    bool on_key(int key, int action, int mods);
    // Pointer left the surface: clears any hover.
    bool on_mouse_leave();

    void set_on_hover(HoverCallback cb) { on_hover_ = std::move(cb); }
    const std::optional<HoveredObject>& hovered_object() const { return hovered_; }

    // ─── Drawing ────────────────────────────────────────────────────────

    // Paint the cached state onto the surface.
    void render();

    const TimelineDrawState& draw_state() const { return draw_state_; }
    const LayerGeometry&     layers() const { return geometry_; }
    const HoverIndex&        hover_index() const;

    // Number of full draw-state derivations so far.
    uint64_t redraw_count() const { return redraw_count_; }
    // Number of playhead-only position updates so far.
    uint64_t playhead_redraw_count() const { return playhead_redraw_count_; }

    const VisualizerConfig& config() const { return config_; }

   private:
    DrawSurface*     surface_;
    Resolver&        resolver_;
    VisualizerConfig config_;

    std::unique_ptr<ViewportController> viewport_;
    std::unique_ptr<PlayheadLoop>       playhead_;
    std::unique_ptr<HoverIndex>         hover_index_;
    std::unique_ptr<InputHandler>       input_;

    std::vector<RetainedSchedule> schedules_;
    uint64_t                      next_generation_ = 0;

    LayerGeometry     geometry_;
    TimelineDrawState draw_state_;

    std::optional<HoveredObject>   hovered_;
    std::optional<DrawStateKey>    hovered_key_;
    std::optional<PointerPosition> last_pointer_;
    HoverCallback                  on_hover_;

    uint64_t redraw_count_          = 0;
    uint64_t playhead_redraw_count_ = 0;

    void update_canvas_geometry();
    void push_schedule(ResolvedTimeline timeline);
    void discard_expired_history();
    void rebuild_layers();
    void redraw();
    void update_hover(double x, double y);
    void set_hover(std::optional<DrawStateKey> key, double x, double y);
    const RetainedSchedule* find_schedule(uint64_t generation) const;
};

}   // namespace tlviz

#pragma once

#include <chrono>
#include <optional>
#include <tlviz/geometry.hpp>

namespace tlviz
{

class ViewportController;

// What a tick changed, and so how much must be redrawn.
enum class TickResult
{
    Idle,            // nothing visible moved
    PlayheadMoved,   // only the playhead marker
    ViewportMoved,   // the window scrolled; full redraw
};

// Per-frame stepper for the playhead and viewport auto-play.
class PlayheadLoop
{
   public:
    using Clock = std::chrono::steady_clock;

    // Nominal dt of the first tick, in seconds.
    static constexpr double FIRST_TICK_DT = 0.001;

    // enabled: playhead motion is available at all (draw_playhead).
    PlayheadLoop(bool enabled, double speed);

    bool enabled() const { return enabled_; }

    double time() const { return time_; }
    void   set_time(double t) { time_ = t < 0.0 ? 0.0 : t; }

    double position() const { return position_; }

    bool playing() const { return playing_; }
    void set_playing(bool playing) { playing_ = playing; }

    double speed() const { return speed_; }
    void   set_speed(double speed) { speed_ = speed; }

    bool viewport_playing() const { return viewport_playing_; }
    void set_viewport_playing(bool playing) { viewport_playing_ = playing; }

    // Recompute the marker's pixel position. Returns true if it moved.
    bool compute_position(const ViewportSnapshot& vp);

    // Advance by the wall-clock time since the previous tick.
    TickResult tick(Clock::time_point now, ViewportController& viewport);

    // Forget the previous tick time; the next tick uses FIRST_TICK_DT.
    void reset_clock() { last_tick_.reset(); }

   private:
    bool   enabled_;
    double time_             = 0.0;
    double position_         = -1.0;
    bool   playing_          = false;
    double speed_            = 1.0;
    bool   viewport_playing_ = false;

    std::optional<Clock::time_point> last_tick_;
};

}   // namespace tlviz

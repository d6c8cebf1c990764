#include "playhead.hpp"

#include <tlviz/logger.hpp>

#include "core/coord_mapper.hpp"
#include "core/viewport_controller.hpp"

namespace tlviz
{

PlayheadLoop::PlayheadLoop(bool enabled, double speed) : enabled_(enabled), speed_(speed) {}

bool PlayheadLoop::compute_position(const ViewportSnapshot& vp)
{
    double pos = time_to_x(vp, time_);
    if (pos == position_)
        return false;

    position_ = pos;
    return true;
}

TickResult PlayheadLoop::tick(Clock::time_point now, ViewportController& viewport)
{
    double dt = FIRST_TICK_DT;
    if (last_tick_)
        dt = std::chrono::duration<double>(now - *last_tick_).count();
    last_tick_ = now;

    bool playhead_moves = enabled_ && playing_;
    if (playhead_moves)
        set_time(time_ + speed_ * dt);

    if (viewport_playing_)
    {
        bool play = true;
        if (playhead_moves
            && (time_ > viewport.draw_time_end() || time_ < viewport.draw_time_start()))
        {
            play = false;
        }

        if (play && viewport.scroll_by_time(speed_ * dt))
        {
            compute_position(viewport.snapshot());
            return TickResult::ViewportMoved;
        }
    }

    if (playhead_moves && compute_position(viewport.snapshot()))
    {
        TLVIZ_LOG_TRACE("playhead", "Playhead at t={} x={}", time_, position_);
        return TickResult::PlayheadMoved;
    }

    return TickResult::Idle;
}

}   // namespace tlviz

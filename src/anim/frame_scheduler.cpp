#include "frame_scheduler.hpp"

#include <thread>
#include <tlviz/logger.hpp>

namespace tlviz
{

FrameScheduler::FrameScheduler(float target_fps, Mode mode) : mode_(mode)
{
    set_target_fps(target_fps);
    reset();
}

void FrameScheduler::set_target_fps(float fps)
{
    if (fps > 0.0f)
        target_fps_ = fps;
}

void FrameScheduler::begin_frame()
{
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        start_time_       = frame_start_;
        last_frame_start_ = frame_start_;
        dt_               = 0.0f;
        elapsed_sec_      = 0.0f;
        frame_number_     = 0;
        return;
    }

    Duration dt_duration = frame_start_ - last_frame_start_;
    last_frame_start_    = frame_start_;

    float raw_dt = static_cast<float>(dt_duration.count());
    dt_          = raw_dt > MAX_DT ? MAX_DT : raw_dt;
    elapsed_sec_ = static_cast<float>(Duration(frame_start_ - start_time_).count());
    ++frame_number_;

    float target_ms = 1000.0f / target_fps_;
    float dt_ms     = raw_dt * 1000.0f;
    if (mode_ != Mode::Uncapped && dt_ms > target_ms * 2.0f)
    {
        ++hitch_count_;
        TLVIZ_LOG_DEBUG("scheduler", "Frame {} hitch: {}ms (target: {}ms)", frame_number_, dt_ms,
                        target_ms);
    }
}

void FrameScheduler::end_frame()
{
    if (mode_ != Mode::TargetFPS)
        return;

    Duration target_frame_time{1.0 / static_cast<double>(target_fps_)};
    Duration frame_duration = Clock::now() - frame_start_;
    if (frame_duration >= target_frame_time)
        return;

    // Sleep for most of the remaining time, spin the last millisecond.
    Duration remaining  = target_frame_time - frame_duration;
    Duration sleep_time = remaining - Duration{0.001};
    if (sleep_time.count() > 0.0)
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(sleep_time));

    auto deadline = frame_start_ + std::chrono::duration_cast<Clock::duration>(target_frame_time);
    while (Clock::now() < deadline)
    {
    }
}

void FrameScheduler::reset()
{
    first_frame_  = true;
    dt_           = 0.0f;
    elapsed_sec_  = 0.0f;
    frame_number_ = 0;
    hitch_count_  = 0;
}

}   // namespace tlviz

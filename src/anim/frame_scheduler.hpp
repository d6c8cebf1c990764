#pragma once

#include <chrono>
#include <cstdint>

namespace tlviz
{

// Paces the viewer's render loop and keeps per-frame timing.
class FrameScheduler
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep + spin-wait to hit target FPS
        VSync,       // Let the swapchain/driver handle pacing
        Uncapped,    // Run as fast as possible
    };

    explicit FrameScheduler(float target_fps = 60.0f, Mode mode = Mode::TargetFPS);

    // Ignored unless fps > 0.
    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Call at the start and end of each frame
    void begin_frame();
    void end_frame();

    // Reset timing (e.g., after the window was minimized)
    void reset();

    float    dt() const { return dt_; }
    float    elapsed_seconds() const { return elapsed_sec_; }
    uint64_t frame_number() const { return frame_number_; }

    // Frames that took more than twice the target frame time.
    uint64_t hitch_count() const { return hitch_count_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    static constexpr float MAX_DT = 0.25f;

    float target_fps_ = 60.0f;
    Mode  mode_       = Mode::TargetFPS;

    TimePoint start_time_;
    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    float    dt_           = 0.0f;
    float    elapsed_sec_  = 0.0f;
    uint64_t frame_number_ = 0;
    uint64_t hitch_count_  = 0;
};

}   // namespace tlviz

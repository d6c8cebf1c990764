#include <chrono>
#include <gtest/gtest.h>
#include <thread>

#include "anim/frame_scheduler.hpp"

using namespace tlviz;

TEST(FrameScheduler, FirstFrameHasZeroDt)
{
    FrameScheduler sched(60.0f, FrameScheduler::Mode::Uncapped);
    sched.begin_frame();
    EXPECT_FLOAT_EQ(sched.dt(), 0.0f);
    EXPECT_EQ(sched.frame_number(), 0u);
    sched.end_frame();
}

TEST(FrameScheduler, FrameNumberAdvances)
{
    FrameScheduler sched(60.0f, FrameScheduler::Mode::Uncapped);
    for (int i = 0; i < 5; ++i)
    {
        sched.begin_frame();
        sched.end_frame();
    }
    EXPECT_EQ(sched.frame_number(), 4u);
    EXPECT_GE(sched.elapsed_seconds(), 0.0f);
}

TEST(FrameScheduler, DtIsClamped)
{
    FrameScheduler sched(60.0f, FrameScheduler::Mode::Uncapped);
    sched.begin_frame();
    sched.end_frame();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    sched.begin_frame();
    EXPECT_LE(sched.dt(), 0.25f);
    EXPECT_GT(sched.dt(), 0.2f);
}

TEST(FrameScheduler, TargetFpsPacesFrames)
{
    FrameScheduler sched(50.0f, FrameScheduler::Mode::TargetFPS);
    auto           start = std::chrono::steady_clock::now();
    sched.begin_frame();
    sched.end_frame();
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(std::chrono::duration<double>(elapsed).count(), 0.019);
}

TEST(FrameScheduler, NonPositiveTargetIgnored)
{
    FrameScheduler sched(30.0f);
    sched.set_target_fps(0.0f);
    EXPECT_FLOAT_EQ(sched.target_fps(), 30.0f);
    sched.set_target_fps(-5.0f);
    EXPECT_FLOAT_EQ(sched.target_fps(), 30.0f);
}

TEST(FrameScheduler, ResetRestartsCounting)
{
    FrameScheduler sched(60.0f, FrameScheduler::Mode::Uncapped);
    sched.begin_frame();
    sched.begin_frame();
    ASSERT_EQ(sched.frame_number(), 1u);

    sched.reset();
    sched.begin_frame();
    EXPECT_EQ(sched.frame_number(), 0u);
    EXPECT_FLOAT_EQ(sched.dt(), 0.0f);
}

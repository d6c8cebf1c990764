#include <cmath>
#include <gtest/gtest.h>

#include "core/coord_mapper.hpp"
#include "core/viewport_controller.hpp"

using namespace tlviz;

class ViewportControllerTest : public ::testing::Test
{
   protected:
    void SetUp() override { vc_.set_canvas_width(1000.0); }

    VisualizerConfig   config_;
    ViewportController vc_{config_};
};

// ─── Defaults ───────────────────────────────────────────────────────────────

TEST_F(ViewportControllerTest, DefaultWindow)
{
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 0.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 500.0);
    EXPECT_DOUBLE_EQ(vc_.zoom(), 100.0);
    EXPECT_DOUBLE_EQ(vc_.scaled_draw_time_range(), 500.0);
}

TEST_F(ViewportControllerTest, CanvasLayout)
{
    EXPECT_DOUBLE_EQ(vc_.timeline_start(), 250.0);
    EXPECT_DOUBLE_EQ(vc_.timeline_width(), 750.0);

    auto vp = vc_.snapshot();
    EXPECT_DOUBLE_EQ(vp.canvas_width, 1000.0);
    EXPECT_DOUBLE_EQ(vp.pixels_per_unit_time(), 1.5);
}

// ─── Pan ────────────────────────────────────────────────────────────────────

TEST_F(ViewportControllerTest, PanShiftsWindow)
{
    EXPECT_TRUE(vc_.pan_by_pixels(75.0));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 50.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 550.0);

    EXPECT_TRUE(vc_.pan_by_pixels(-30.0));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 30.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 530.0);
}

TEST_F(ViewportControllerTest, PanNeverBeforeZero)
{
    vc_.pan_by_pixels(75.0);
    EXPECT_TRUE(vc_.pan_by_pixels(-1e9));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 0.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 500.0);

    // Already clamped: no-op.
    EXPECT_FALSE(vc_.pan_by_pixels(-10.0));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 0.0);
}

// ─── Zoom ───────────────────────────────────────────────────────────────────

TEST_F(ViewportControllerTest, ZoomKeepsTimeUnderCursor)
{
    vc_.jump_to(100.0);
    const double cursor_x = 700.0;

    for (double delta : {120.0, -300.0, 35.0})
    {
        double before = x_to_time(vc_.snapshot(), cursor_x);
        ASSERT_TRUE(vc_.zoom_about_cursor(cursor_x, delta));
        auto   vp    = vc_.snapshot();
        double after = x_to_time(vp, cursor_x);
        EXPECT_LT(std::abs(after - before), 1.0 / vp.pixels_per_unit_time()) << "delta=" << delta;
    }
}

TEST_F(ViewportControllerTest, PositiveDeltaZoomsOut)
{
    ASSERT_TRUE(vc_.zoom_about_cursor(625.0, 100.0));
    EXPECT_NEAR(vc_.zoom(), 100.0 * std::pow(1.001, 100.0), 1e-9);
    EXPECT_GT(vc_.draw_time_end() - vc_.draw_time_start(), 500.0);
}

TEST_F(ViewportControllerTest, NegativeDeltaZoomsIn)
{
    ASSERT_TRUE(vc_.zoom_about_cursor(625.0, -100.0));
    EXPECT_NEAR(vc_.zoom(), 100.0 / std::pow(1.001, 100.0), 1e-9);
    EXPECT_LT(vc_.draw_time_end() - vc_.draw_time_start(), 500.0);
}

TEST_F(ViewportControllerTest, ZoomNearZeroShiftsWindowRight)
{
    ASSERT_TRUE(vc_.zoom_about_cursor(251.0, 1000.0));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 0.0);
    EXPECT_NEAR(vc_.draw_time_end() - vc_.draw_time_start(), vc_.scaled_draw_time_range(), 1e-9);
}

TEST_F(ViewportControllerTest, ZoomOutsideTimeAreaIgnored)
{
    EXPECT_FALSE(vc_.zoom_about_cursor(100.0, 50.0));
    EXPECT_FALSE(vc_.zoom_about_cursor(625.0, 0.0));
    EXPECT_DOUBLE_EQ(vc_.zoom(), 100.0);
}

// ─── Absolute changes ───────────────────────────────────────────────────────

TEST_F(ViewportControllerTest, SetZoomRederivesEnd)
{
    vc_.jump_to(40.0);
    vc_.set_zoom(4.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 40.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 60.0);
}

TEST_F(ViewportControllerTest, JumpClampsToZero)
{
    vc_.jump_to(-5.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 0.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 500.0);

    vc_.jump_to(100.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 100.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 600.0);
}

TEST_F(ViewportControllerTest, ScrollByTime)
{
    EXPECT_TRUE(vc_.scroll_by_time(2.5));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 2.5);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 502.5);

    EXPECT_TRUE(vc_.scroll_by_time(-10.0));
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 0.0);
    EXPECT_FALSE(vc_.scroll_by_time(-1.0));
}

TEST_F(ViewportControllerTest, ResetWindowUsesCurrentZoom)
{
    vc_.set_zoom(50.0);
    vc_.reset_window(20.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_start(), 20.0);
    EXPECT_DOUBLE_EQ(vc_.draw_time_end(), 270.0);
}

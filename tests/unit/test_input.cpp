#include <gtest/gtest.h>

#include "core/viewport_controller.hpp"
#include "ui/input.hpp"

using namespace tlviz;

class InputHandlerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        viewport_.set_canvas_width(1000.0);
        handler_.set_on_viewport_changed([this]() { ++changes_; });
        handler_.set_on_pointer_move(
            [this](double x, double y)
            {
                last_x_ = x;
                last_y_ = y;
            });
    }

    void press(double x, int mods = 0)
    {
        handler_.on_mouse_button(InputHandler::MOUSE_BUTTON_LEFT, InputHandler::ACTION_PRESS, mods, x,
                                 10.0);
    }

    void release(double x)
    {
        handler_.on_mouse_button(InputHandler::MOUSE_BUTTON_LEFT, InputHandler::ACTION_RELEASE, 0, x,
                                 10.0);
    }

    VisualizerConfig   config_;
    ViewportController viewport_{config_};
    InputHandler       handler_{viewport_, config_};
    int                changes_ = 0;
    double             last_x_  = -1.0;
    double             last_y_  = -1.0;
};

// ─── Drag ───────────────────────────────────────────────────────────────────

TEST_F(InputHandlerTest, DragPansOppositeToPointer)
{
    press(500.0);
    EXPECT_EQ(handler_.mode(), InteractionMode::Dragging);

    // 75 px left at 1.5 px per unit moves the window 50 units later.
    EXPECT_TRUE(handler_.on_mouse_move(425.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 50.0);
    EXPECT_EQ(changes_, 1);

    release(425.0);
    EXPECT_EQ(handler_.mode(), InteractionMode::Idle);
}

TEST_F(InputHandlerTest, DirectionReversalReanchorsWithoutScrolling)
{
    press(500.0);
    handler_.on_mouse_move(425.0, 10.0);
    ASSERT_DOUBLE_EQ(viewport_.draw_time_start(), 50.0);

    handler_.on_mouse_move(450.0, 10.0);
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 50.0);

    handler_.on_mouse_move(480.0, 10.0);
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 30.0);
}

TEST_F(InputHandlerTest, DragCannotPanBeforeZero)
{
    press(300.0);
    EXPECT_TRUE(handler_.on_mouse_move(900.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 0.0);
    EXPECT_EQ(changes_, 0);
}

TEST_F(InputHandlerTest, MoveWithoutDragOnlyReportsPointer)
{
    EXPECT_FALSE(handler_.on_mouse_move(600.0, 33.0));
    EXPECT_DOUBLE_EQ(last_x_, 600.0);
    EXPECT_DOUBLE_EQ(last_y_, 33.0);
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 0.0);
}

TEST_F(InputHandlerTest, OtherButtonsIgnored)
{
    EXPECT_FALSE(handler_.on_mouse_button(1, InputHandler::ACTION_PRESS, 0, 500.0, 10.0));
    EXPECT_EQ(handler_.mode(), InteractionMode::Idle);
}

// ─── Wheel ──────────────────────────────────────────────────────────────────

TEST_F(InputHandlerTest, WheelOverLabelsIgnored)
{
    handler_.on_key(InputHandler::KEY_LEFT_CONTROL, InputHandler::ACTION_PRESS, InputHandler::MOD_CONTROL);
    EXPECT_FALSE(handler_.on_scroll(0.0, 100.0, 200.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.zoom(), 100.0);
}

TEST_F(InputHandlerTest, CtrlWheelZooms)
{
    handler_.on_key(InputHandler::KEY_LEFT_CONTROL, InputHandler::ACTION_PRESS, InputHandler::MOD_CONTROL);

    EXPECT_TRUE(handler_.on_scroll(0.0, 100.0, 625.0, 10.0));
    EXPECT_GT(viewport_.zoom(), 100.0);
    EXPECT_EQ(changes_, 1);

    double zoomed_out = viewport_.zoom();
    EXPECT_TRUE(handler_.on_scroll(0.0, -200.0, 625.0, 10.0));
    EXPECT_LT(viewport_.zoom(), zoomed_out);
}

TEST_F(InputHandlerTest, ControlReleaseStopsZoom)
{
    handler_.on_key(InputHandler::KEY_LEFT_CONTROL, InputHandler::ACTION_PRESS, InputHandler::MOD_CONTROL);
    // GLFW still reports the modifier in its own release event.
    handler_.on_key(InputHandler::KEY_LEFT_CONTROL, InputHandler::ACTION_RELEASE, InputHandler::MOD_CONTROL);
    EXPECT_EQ(handler_.mods() & InputHandler::MOD_CONTROL, 0);

    EXPECT_TRUE(handler_.on_scroll(0.0, 100.0, 625.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.zoom(), 100.0);
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 0.0);
}

TEST_F(InputHandlerTest, ModsFromMouseButton)
{
    press(600.0, InputHandler::MOD_CONTROL);
    release(600.0);
    // Release reports no modifiers.
    EXPECT_EQ(handler_.mods(), 0);

    press(600.0, InputHandler::MOD_CONTROL);
    EXPECT_TRUE(handler_.on_scroll(0.0, 50.0, 625.0, 10.0));
    EXPECT_GT(viewport_.zoom(), 100.0);
}

TEST_F(InputHandlerTest, HorizontalWheelPans)
{
    EXPECT_TRUE(handler_.on_scroll(30.0, 0.0, 625.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 20.0);
    EXPECT_EQ(changes_, 1);
}

TEST_F(InputHandlerTest, AltWheelPansWithVerticalDelta)
{
    handler_.on_key(InputHandler::KEY_LEFT_ALT, InputHandler::ACTION_PRESS, InputHandler::MOD_ALT);
    EXPECT_TRUE(handler_.on_scroll(0.0, 30.0, 625.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 20.0);
}

TEST_F(InputHandlerTest, PlainVerticalWheelDoesNothing)
{
    EXPECT_TRUE(handler_.on_scroll(0.0, 30.0, 625.0, 10.0));
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 0.0);
    EXPECT_EQ(changes_, 0);
}

TEST_F(InputHandlerTest, PanStepScalesWheel)
{
    config_.step_size  = 2.0;
    config_.pan_factor = 3.0;
    EXPECT_TRUE(handler_.on_scroll(15.0, 0.0, 625.0, 10.0));
    // 15 * 6 = 90 px at 1.5 px per unit
    EXPECT_DOUBLE_EQ(viewport_.draw_time_start(), 60.0);
}

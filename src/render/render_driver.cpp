#include "render_driver.hpp"

#include <algorithm>
#include <stdexcept>

#include "core/coord_mapper.hpp"
#include "style.hpp"

namespace tlviz
{

void RenderDriver::paint(const RenderFrame& frame)
{
    if (!frame.viewport || !frame.layers || !frame.draw_state)
        throw std::invalid_argument("RenderDriver::paint: incomplete frame");

    auto width  = static_cast<float>(frame.viewport->canvas_width);
    auto height = static_cast<float>(frame.canvas_height);
    surface_.fill_rect(0.0f, 0.0f, width, height, style::BACKGROUND);

    paint_layers(frame);
    paint_objects(frame);
    paint_playhead(frame);
}

void RenderDriver::paint_layers(const RenderFrame& frame)
{
    const auto& vp         = *frame.viewport;
    auto        label_w    = static_cast<float>(vp.timeline_start);
    auto        row_height = static_cast<float>(frame.layers->row_height);

    for (const auto& [name, row] : frame.layers->rows)
    {
        float top = static_cast<float>(row) * row_height;
        surface_.fill_rect(0.0f, top, label_w, row_height, style::LABEL_BACKGROUND);
        surface_.draw_text(0.0f, top + row_height / 2.0f, name, style::TEXT, style::TEXT_SIZE,
                           TextAlign::Left);

        if (row > 0)
        {
            surface_.fill_rect(label_w, top, static_cast<float>(vp.timeline_width),
                               style::ROW_LINE_THICKNESS, style::ROW_LINE);
        }
    }
}

void RenderDriver::paint_objects(const RenderFrame& frame)
{
    const auto& vp     = *frame.viewport;
    auto        area_l = static_cast<float>(vp.timeline_start);
    auto        area_r = static_cast<float>(vp.timeline_end());
    last_object_count_ = 0;

    surface_.push_clip(area_l, 0.0f, area_r - area_l, static_cast<float>(frame.canvas_height));

    for (const auto& [key, state] : *frame.draw_state)
    {
        if (!state.visible)
            continue;

        auto x = static_cast<float>(state.left);
        auto y = static_cast<float>(state.top);
        auto w = static_cast<float>(state.width);
        auto h = static_cast<float>(state.height);

        surface_.fill_rect(x, y, w, h, style::OBJECT_FILL);
        surface_.stroke_rect(x, y, w, h, style::OBJECT_BORDER, style::OBJECT_BORDER_WIDTH);

        // Label sits in the middle of the rectangle's visible part.
        float label_x = (std::max(x, area_l) + std::min(x + w, area_r)) / 2.0f;
        surface_.draw_text(label_x, y + h / 2.0f, key.object_id, style::TEXT, style::TEXT_SIZE,
                           TextAlign::Center);
        ++last_object_count_;
    }

    surface_.pop_clip();
}

void RenderDriver::paint_playhead(const RenderFrame& frame)
{
    if (!frame.draw_playhead || frame.playhead_x == OFFSCREEN_LEFT)
        return;

    surface_.fill_rect(static_cast<float>(frame.playhead_x), 0.0f, style::PLAYHEAD_WIDTH,
                       static_cast<float>(frame.canvas_height), style::PLAYHEAD);
}

}   // namespace tlviz

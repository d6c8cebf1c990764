#include "imgui_surface.hpp"

#include <cfloat>
#include <imgui.h>
#include <tlviz/logger.hpp>

namespace tlviz
{

void ImGuiSurface::begin(ImDrawList* draw_list, float origin_x, float origin_y)
{
    draw_list_  = draw_list;
    origin_x_   = origin_x;
    origin_y_   = origin_y;
    clip_depth_ = 0;
}

void ImGuiSurface::end()
{
    // Unbalanced clips would leak into the rest of the ImGui frame.
    while (clip_depth_ > 0)
        pop_clip();
    draw_list_ = nullptr;
}

bool ImGuiSurface::set_size(float width, float height)
{
    if (width == width_ && height == height_)
        return false;
    width_  = width;
    height_ = height;
    return true;
}

void ImGuiSurface::fill_rect(float x, float y, float w, float h, const Color& color)
{
    if (!draw_list_)
        return;
    ImVec2 p0(origin_x_ + x, origin_y_ + y);
    draw_list_->AddRectFilled(p0, ImVec2(p0.x + w, p0.y + h), color.to_abgr32());
}

void ImGuiSurface::stroke_rect(float x, float y, float w, float h, const Color& color, float thickness)
{
    if (!draw_list_)
        return;
    ImVec2 p0(origin_x_ + x, origin_y_ + y);
    draw_list_->AddRect(p0, ImVec2(p0.x + w, p0.y + h), color.to_abgr32(), 0.0f, 0, thickness);
}

void ImGuiSurface::draw_text(float x, float y, std::string_view text, const Color& color, float size,
                             TextAlign align)
{
    if (!draw_list_ || text.empty())
        return;

    ImFont*     font   = ImGui::GetFont();
    const char* begin  = text.data();
    const char* end    = text.data() + text.size();
    ImVec2      extent = font->CalcTextSizeA(size, FLT_MAX, 0.0f, begin, end);

    // y is the text's vertical middle.
    float left = origin_x_ + x;
    if (align == TextAlign::Center)
        left -= extent.x * 0.5f;
    float top = origin_y_ + y - extent.y * 0.5f;

    draw_list_->AddText(font, size, ImVec2(left, top), color.to_abgr32(), begin, end);
}

void ImGuiSurface::push_clip(float x, float y, float w, float h)
{
    if (!draw_list_)
        return;
    ImVec2 p0(origin_x_ + x, origin_y_ + y);
    draw_list_->PushClipRect(p0, ImVec2(p0.x + w, p0.y + h), true);
    ++clip_depth_;
}

void ImGuiSurface::pop_clip()
{
    if (!draw_list_)
        return;
    if (clip_depth_ == 0)
    {
        TLVIZ_LOG_WARN("render", "pop_clip without matching push_clip");
        return;
    }
    draw_list_->PopClipRect();
    --clip_depth_;
}

}   // namespace tlviz

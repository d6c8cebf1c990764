#pragma once

#include <tlviz/surface.hpp>

struct ImDrawList;

namespace tlviz
{

// DrawSurface over an ImGui draw list. The host binds a list and a screen
// origin each frame before rendering into it.
class ImGuiSurface : public DrawSurface
{
   public:
    ImGuiSurface() = default;

    void begin(ImDrawList* draw_list, float origin_x, float origin_y);
    void end();

    // Returns true if the size changed.
    bool set_size(float width, float height);

    float width() const override { return width_; }
    float height() const override { return height_; }

    void fill_rect(float x, float y, float w, float h, const Color& color) override;
    void stroke_rect(float x, float y, float w, float h, const Color& color, float thickness) override;
    void draw_text(float x, float y, std::string_view text, const Color& color, float size,
                   TextAlign align) override;

    void push_clip(float x, float y, float w, float h) override;
    void pop_clip() override;

   private:
    ImDrawList* draw_list_  = nullptr;
    float       origin_x_   = 0.0f;
    float       origin_y_   = 0.0f;
    float       width_      = 0.0f;
    float       height_     = 0.0f;
    int         clip_depth_ = 0;
};

}   // namespace tlviz

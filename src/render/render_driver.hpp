#pragma once

#include <tlviz/geometry.hpp>
#include <tlviz/surface.hpp>

namespace tlviz
{

// Everything one frame paints. References must stay valid for the call.
struct RenderFrame
{
    const ViewportSnapshot*  viewport      = nullptr;
    const LayerGeometry*     layers        = nullptr;
    const TimelineDrawState* draw_state    = nullptr;
    double                   canvas_height = 0.0;
    bool                     draw_playhead = false;
    double                   playhead_x    = -1.0;
};

// Issues the drawing calls for one frame, back to front: background, layer
// labels and row lines, instances, playhead.
class RenderDriver
{
   public:
    explicit RenderDriver(DrawSurface& surface) : surface_(surface) {}

    void paint(const RenderFrame& frame);

    // Number of instance rectangles issued by the last paint().
    size_t last_object_count() const { return last_object_count_; }

   private:
    DrawSurface& surface_;
    size_t       last_object_count_ = 0;

    void paint_layers(const RenderFrame& frame);
    void paint_objects(const RenderFrame& frame);
    void paint_playhead(const RenderFrame& frame);
};

}   // namespace tlviz

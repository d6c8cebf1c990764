#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <string>

namespace tlviz
{

// Identifies one drawn rectangle: an instance of an object within one
// retained schedule. generation is the schedule's id, not its position, so
// keys survive older schedules being discarded.
struct DrawStateKey
{
    uint64_t    generation = 0;
    std::string object_id;
    std::string instance_id;

    auto operator<=>(const DrawStateKey&) const = default;
    bool operator==(const DrawStateKey&) const  = default;

    std::string to_string() const;
};

// Screen rectangle of one instance. Hidden instances carry a zero-size
// rectangle and row -1.
struct DrawState
{
    double width   = 0.0;
    double height  = 0.0;
    double left    = 0.0;
    double top     = 0.0;
    bool   visible = false;
    int    row     = -1;

    bool operator==(const DrawState&) const = default;
};

using TimelineDrawState = std::map<DrawStateKey, DrawState>;

// Layer name → row index, in lexicographic order of the names.
using LayerMap = std::map<std::string, size_t>;

// Everything needed to map between time and horizontal pixels.
struct ViewportSnapshot
{
    double draw_time_start = 0.0;
    double draw_time_end   = 1.0;
    double timeline_start  = 0.0;   // left edge of the time area, px
    double timeline_width  = 1.0;   // width of the time area, px
    double canvas_width    = 1.0;   // full surface width, px

    double pixels_per_unit_time() const
    {
        return timeline_width / (draw_time_end - draw_time_start);
    }

    double timeline_end() const { return timeline_start + timeline_width; }
};

// Vertical layout derived from the layer set.
struct LayerGeometry
{
    LayerMap rows;
    double   row_height    = 0.0;
    double   object_height = 0.0;
};

}   // namespace tlviz

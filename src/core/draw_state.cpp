#include "draw_state.hpp"

#include <algorithm>
#include <tlviz/logger.hpp>

namespace tlviz
{

bool show_on_timeline(const ViewportSnapshot& vp, double start, std::optional<double> end)
{
    if (start >= vp.draw_time_end)
        return false;
    if (end && *end <= vp.draw_time_start)
        return false;
    return true;
}

double object_width(const ViewportSnapshot& vp, double start, std::optional<double> end)
{
    if (!end)
        return vp.canvas_width;

    double visible_start = std::max(start, vp.draw_time_start);
    double width         = (*end - visible_start) * vp.pixels_per_unit_time();
    return std::max(1.0, width);
}

double object_left(const ViewportSnapshot& vp, double start)
{
    double offset = (start - vp.draw_time_start) * vp.pixels_per_unit_time();
    return vp.timeline_start + std::max(0.0, offset);
}

void derive_draw_state_into(TimelineDrawState&      out,
                            const ResolvedTimeline& schedule,
                            uint64_t                generation,
                            const ViewportSnapshot& vp,
                            const LayerGeometry&    geometry)
{
    for (const auto& [id, obj] : schedule.objects)
    {
        auto row_it = geometry.rows.find(obj.layer());
        if (row_it == geometry.rows.end())
        {
            TLVIZ_LOG_DEBUG("visualizer", "Object '{}' has no row for layer '{}'", id, obj.layer());
        }

        for (const auto& inst : obj.resolved.instances)
        {
            DrawStateKey key{generation, id, inst.id};
            DrawState    state;

            if (row_it != geometry.rows.end() && show_on_timeline(vp, inst.start, inst.end))
            {
                state.row     = static_cast<int>(row_it->second);
                state.visible = true;
                state.width   = object_width(vp, inst.start, inst.end);
                state.height  = geometry.object_height;
                state.left    = object_left(vp, inst.start);
                state.top     = static_cast<double>(row_it->second) * geometry.row_height;
            }

            out.insert_or_assign(std::move(key), state);
        }
    }
}

TimelineDrawState derive_draw_state(const ResolvedTimeline& schedule,
                                    uint64_t                generation,
                                    const ViewportSnapshot& vp,
                                    const LayerGeometry&    geometry)
{
    TimelineDrawState result;
    derive_draw_state_into(result, schedule, generation, vp, geometry);
    return result;
}

}   // namespace tlviz

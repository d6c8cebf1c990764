#pragma once

#include <cstdint>
#include <optional>
#include <tlviz/geometry.hpp>
#include <tlviz/timeline.hpp>

namespace tlviz
{

// True if [start, end) overlaps the visible window. An empty end is +inf.
bool show_on_timeline(const ViewportSnapshot& vp, double start, std::optional<double> end);

// Open-ended instances span the whole canvas; bounded ones are at least
// one pixel wide.
double object_width(const ViewportSnapshot& vp, double start, std::optional<double> end);

double object_left(const ViewportSnapshot& vp, double start);

// Rectangle for every instance of every object in one schedule. Instances
// outside the window, or on a layer without a row, are hidden.
TimelineDrawState derive_draw_state(const ResolvedTimeline& schedule,
                                    uint64_t                generation,
                                    const ViewportSnapshot& vp,
                                    const LayerGeometry&    geometry);

// Same, appending into an existing map.
void derive_draw_state_into(TimelineDrawState&      out,
                            const ResolvedTimeline& schedule,
                            uint64_t                generation,
                            const ViewportSnapshot& vp,
                            const LayerGeometry&    geometry);

}   // namespace tlviz

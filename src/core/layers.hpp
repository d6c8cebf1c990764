#pragma once

#include <tlviz/config.hpp>
#include <tlviz/geometry.hpp>
#include <tlviz/timeline.hpp>
#include <vector>

namespace tlviz
{

// Sorted union of layer names across all schedules: the keys of each
// schedule's layer map plus the layer of every object.
LayerMap collect_layers(const std::vector<const ResolvedTimeline*>& schedules);

// Row height = min(max_layer_height, canvas_height / rows). With no rows
// the maximum height is used.
LayerGeometry compute_layer_geometry(LayerMap rows, double canvas_height, const VisualizerConfig& config);

}   // namespace tlviz

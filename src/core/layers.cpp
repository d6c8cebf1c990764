#include "layers.hpp"

#include <algorithm>
#include <set>

namespace tlviz
{

LayerMap collect_layers(const std::vector<const ResolvedTimeline*>& schedules)
{
    std::set<std::string> names;
    for (const ResolvedTimeline* schedule : schedules)
    {
        if (!schedule)
            continue;
        for (const auto& [name, ids] : schedule->layers)
            names.insert(name);
        for (const auto& [id, obj] : schedule->objects)
            names.insert(obj.layer());
    }

    LayerMap rows;
    size_t   index = 0;
    for (const auto& name : names)
        rows.emplace(name, index++);
    return rows;
}

LayerGeometry compute_layer_geometry(LayerMap rows, double canvas_height, const VisualizerConfig& config)
{
    LayerGeometry geom;
    geom.rows = std::move(rows);

    if (geom.rows.empty())
        geom.row_height = config.max_layer_height;
    else
        geom.row_height = std::min(config.max_layer_height,
                                   canvas_height / static_cast<double>(geom.rows.size()));

    geom.object_height = geom.row_height * config.object_height_fraction;
    return geom;
}

}   // namespace tlviz

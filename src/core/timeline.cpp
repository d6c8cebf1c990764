#include <tlviz/geometry.hpp>
#include <tlviz/timeline.hpp>

namespace tlviz
{

size_t ResolvedTimeline::instance_count() const
{
    size_t count = 0;
    for (const auto& [id, obj] : objects)
        count += obj.resolved.instances.size();
    return count;
}

std::string DrawStateKey::to_string() const
{
    return "timelineObject:" + std::to_string(generation) + ":" + object_id + ":" + instance_id;
}

}   // namespace tlviz

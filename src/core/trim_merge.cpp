#include "trim_merge.hpp"

#include <limits>
#include <tlviz/logger.hpp>

namespace tlviz
{

namespace
{

double end_or_inf(const std::optional<double>& end)
{
    return end.value_or(std::numeric_limits<double>::infinity());
}

// Clamped copy of inst, or nullopt if nothing of it lies within range.
std::optional<Instance> trim_instance(const Instance& inst, const TrimRange& range)
{
    Instance out = inst;

    if (range.start)
    {
        if (end_or_inf(inst.end) <= *range.start)
            return std::nullopt;
        if (out.start < *range.start)
            out.start = *range.start;
    }

    if (range.end)
    {
        if (inst.start >= *range.end)
            return std::nullopt;
        if (end_or_inf(out.end) > *range.end)
            out.end = *range.end;
    }

    if (out.start >= end_or_inf(out.end))
        return std::nullopt;

    return out;
}

}   // anonymous namespace

ResolvedTimeline trim_timeline(const ResolvedTimeline& timeline, const TrimRange& range)
{
    ResolvedTimeline result;
    result.layers     = timeline.layers;
    result.classes    = timeline.classes;
    result.statistics = timeline.statistics;
    result.options    = timeline.options;

    for (const auto& [id, obj] : timeline.objects)
    {
        std::vector<Instance> kept;
        for (const auto& inst : obj.resolved.instances)
        {
            if (auto trimmed = trim_instance(inst, range))
                kept.push_back(std::move(*trimmed));
        }

        if (kept.empty())
            continue;

        ResolvedTimelineObject copy;
        copy.object              = obj.object;
        copy.resolved.resolved   = obj.resolved.resolved;
        copy.resolved.level_deep = obj.resolved.level_deep;
        copy.resolved.instances  = std::move(kept);
        result.objects.emplace(id, std::move(copy));
    }

    return result;
}

MergeResult merge_timelines(ResolvedTimeline past, ResolvedTimeline present)
{
    MergeResult result;

    for (auto it = past.objects.begin(); it != past.objects.end();)
    {
        auto& past_obj   = it->second;
        auto  present_it = present.objects.find(it->first);
        if (present_it == present.objects.end())
        {
            ++it;
            continue;
        }

        auto& present_obj = present_it->second;
        if (past_obj.object != present_obj.object)
        {
            TLVIZ_LOG_WARN("merge",
                           "Object '{}' differs across the seam; instances kept separately",
                           it->first);
            result.mismatched_ids.push_back(it->first);
            ++it;
            continue;
        }

        auto& past_instances = past_obj.resolved.instances;
        for (auto inst_it = past_instances.begin(); inst_it != past_instances.end();)
        {
            bool stitched = false;
            if (inst_it->end)
            {
                for (auto& present_inst : present_obj.resolved.instances)
                {
                    if (present_inst.start == *inst_it->end)
                    {
                        present_inst.start = inst_it->start;
                        stitched           = true;
                    }
                }
            }

            if (stitched)
            {
                TLVIZ_LOG_TRACE("merge", "Stitched '{}' instance '{}'", it->first, inst_it->id);
                inst_it = past_instances.erase(inst_it);
            }
            else
                ++inst_it;
        }

        if (past_instances.empty())
            it = past.objects.erase(it);
        else
            ++it;
    }

    result.past    = std::move(past);
    result.present = std::move(present);
    return result;
}

}   // namespace tlviz

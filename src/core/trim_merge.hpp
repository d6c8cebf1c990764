#pragma once

#include <optional>
#include <string>
#include <tlviz/timeline.hpp>
#include <vector>

namespace tlviz
{

// Time bounds for trim_timeline(). An empty bound does not filter.
struct TrimRange
{
    std::optional<double> start;
    std::optional<double> end;
};

// Clip every instance to the range. Instances entirely outside it, or left
// with start >= end after clamping, are dropped, as are objects with no
// surviving instance. Everything but the instance lists is carried over.
ResolvedTimeline trim_timeline(const ResolvedTimeline& timeline, const TrimRange& range);

struct MergeResult
{
    ResolvedTimeline         past;
    ResolvedTimeline         present;
    std::vector<std::string> mismatched_ids;
};

// Stitch two schedules at their seam. For each object in both schedules
// with an identical definition, a past instance ending exactly where a
// present instance starts is folded into the present one. Objects whose
// definitions differ are left alone and reported in mismatched_ids.
MergeResult merge_timelines(ResolvedTimeline past, ResolvedTimeline present);

}   // namespace tlviz

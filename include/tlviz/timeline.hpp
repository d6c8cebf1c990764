#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tlviz
{

// ─── Declarative input ──────────────────────────────────────────────────────

// An enable condition value: either a literal time or an expression the
// resolver understands (e.g. "#intro.end + 5"). Opaque to tlviz.
using EnableValue = std::variant<double, std::string>;

struct TimelineEnable
{
    std::optional<EnableValue> start;
    std::optional<EnableValue> end;
    std::optional<EnableValue> while_expr;
    std::optional<EnableValue> duration;
    std::optional<EnableValue> repeating;

    bool operator==(const TimelineEnable&) const = default;
};

using TimelineContent = std::map<std::string, std::string>;

// A declarative timeline object as handed to the resolver. Owned by the
// caller; never mutated here.
struct TimelineObject
{
    std::string                 id;
    std::string                 layer;
    std::vector<TimelineEnable> enable;
    TimelineContent             content;
    std::vector<std::string>    classes;
    int                         priority = 0;
    bool                        disabled = false;

    bool operator==(const TimelineObject&) const = default;
};

// ─── Resolved output ────────────────────────────────────────────────────────

// A concrete occurrence. start is inclusive, end exclusive; an empty end
// means open-ended.
struct Instance
{
    std::string           id;
    double                start = 0.0;
    std::optional<double> end;

    bool operator==(const Instance&) const = default;
};

struct ResolvedState
{
    std::vector<Instance> instances;
    bool                  resolved   = false;
    int                   level_deep = 0;

    bool operator==(const ResolvedState&) const = default;
};

// The object definition and its resolved block are kept apart so that
// "same logical object" is simply object == object.
struct ResolvedTimelineObject
{
    TimelineObject object;
    ResolvedState  resolved;

    const std::string& id() const { return object.id; }
    const std::string& layer() const { return object.layer; }

    bool operator==(const ResolvedTimelineObject&) const = default;
};

struct ResolveOptions
{
    // Reference time of the resolution. Empty is treated as 0.
    std::optional<double> time;
    std::optional<int>    limit_count;
    std::optional<double> limit_time;

    double time_or_zero() const { return time.value_or(0.0); }

    bool operator==(const ResolveOptions&) const = default;
};

struct ResolveStatistics
{
    uint32_t unresolved_count        = 0;
    uint32_t resolved_count          = 0;
    uint32_t resolved_instance_count = 0;
    uint32_t resolved_object_count   = 0;
    uint32_t resolved_group_count    = 0;
    uint32_t resolved_keyframe_count = 0;

    bool operator==(const ResolveStatistics&) const = default;
};

// One resolution result. Treated as an immutable snapshot; trim and merge
// build new values instead of editing this one.
struct ResolvedTimeline
{
    std::map<std::string, ResolvedTimelineObject>   objects;
    std::map<std::string, std::vector<std::string>> layers;
    std::map<std::string, std::vector<std::string>> classes;
    ResolveStatistics                               statistics;
    ResolveOptions                                  options;

    size_t instance_count() const;

    bool operator==(const ResolvedTimeline&) const = default;
};

// ─── Resolution service ─────────────────────────────────────────────────────

// External scheduling service. Implementations turn declarative objects into
// concrete instances at a reference time. Exceptions propagate to the caller
// of TimelineVisualizer::set_timeline()/update_timeline() untouched.
class Resolver
{
   public:
    virtual ~Resolver() = default;

    virtual ResolvedTimeline resolve(const std::vector<TimelineObject>& objects,
                                     const ResolveOptions&              options) = 0;
};

}   // namespace tlviz

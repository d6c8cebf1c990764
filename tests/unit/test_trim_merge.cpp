#include <gtest/gtest.h>
#include <tlviz/logger.hpp>

#include "core/trim_merge.hpp"
#include "util/scripted_resolver.hpp"

using namespace tlviz;
using namespace tlviz::test;

namespace
{

const std::vector<Instance>& instances_of(const ResolvedTimeline& tl, const std::string& id)
{
    return tl.objects.at(id).resolved.instances;
}

}   // anonymous namespace

// ─── Trim ───────────────────────────────────────────────────────────────────

TEST(TrimTimeline, StartBoundDropsAndClamps)
{
    auto tl = make_timeline({make_object("A", "L1",
                                         {make_instance("a0", 0, 5), make_instance("a1", 5, 15),
                                          make_instance("a2", 12, std::nullopt),
                                          make_instance("a3", 8, 10)})});

    auto trimmed = trim_timeline(tl, TrimRange{10.0, std::nullopt});

    const auto& inst = instances_of(trimmed, "A");
    ASSERT_EQ(inst.size(), 2u);
    EXPECT_EQ(inst[0], make_instance("a1", 10, 15));
    EXPECT_EQ(inst[1], make_instance("a2", 12, std::nullopt));
    for (const auto& i : inst)
    {
        EXPECT_GE(i.start, 10.0);
        EXPECT_TRUE(!i.end || *i.end > 10.0);
    }
}

TEST(TrimTimeline, EndBoundDropsAndClamps)
{
    auto tl = make_timeline({make_object("A", "L1",
                                         {make_instance("a0", 0, std::nullopt),
                                          make_instance("a1", 5, 15), make_instance("a2", 10, 20)})});

    auto trimmed = trim_timeline(tl, TrimRange{std::nullopt, 10.0});

    const auto& inst = instances_of(trimmed, "A");
    ASSERT_EQ(inst.size(), 2u);
    EXPECT_EQ(inst[0], make_instance("a0", 0, 10));
    EXPECT_EQ(inst[1], make_instance("a1", 5, 10));
}

TEST(TrimTimeline, BothBounds)
{
    auto tl = make_timeline({make_object("A", "L1", {make_instance("a0", 0, 20)})});

    auto trimmed = trim_timeline(tl, TrimRange{5.0, 10.0});

    ASSERT_EQ(instances_of(trimmed, "A").size(), 1u);
    EXPECT_EQ(instances_of(trimmed, "A")[0], make_instance("a0", 5, 10));
}

TEST(TrimTimeline, ZeroBoundIsStillABound)
{
    auto tl = make_timeline({make_object("A", "L1", {make_instance("a0", 0, 5)})});

    auto trimmed = trim_timeline(tl, TrimRange{std::nullopt, 0.0});

    EXPECT_TRUE(trimmed.objects.empty());
}

TEST(TrimTimeline, NoBoundsKeepsEverything)
{
    auto tl = make_timeline({make_object("A", "L1", {make_instance("a0", 0, 5)}),
                             make_object("B", "L2", {make_instance("b0", 3, std::nullopt)})});

    EXPECT_EQ(trim_timeline(tl, TrimRange{}), tl);
}

TEST(TrimTimeline, EmptyObjectsOmittedMetadataKept)
{
    auto tl = make_timeline({make_object("A", "L1", {make_instance("a0", 0, 5)}),
                             make_object("B", "L2", {make_instance("b0", 6, 9)})});
    tl.classes["highlight"]             = {"B"};
    tl.statistics.resolved_object_count = 2;
    tl.options.time                     = 3.0;

    auto trimmed = trim_timeline(tl, TrimRange{6.0, std::nullopt});

    EXPECT_EQ(trimmed.objects.count("A"), 0u);
    ASSERT_EQ(trimmed.objects.count("B"), 1u);
    EXPECT_EQ(trimmed.objects.at("B").object, tl.objects.at("B").object);
    EXPECT_EQ(trimmed.layers, tl.layers);
    EXPECT_EQ(trimmed.classes, tl.classes);
    EXPECT_EQ(trimmed.statistics, tl.statistics);
    EXPECT_EQ(trimmed.options, tl.options);
    // Input untouched.
    EXPECT_EQ(tl.objects.size(), 2u);
}

// ─── Merge ──────────────────────────────────────────────────────────────────

TEST(MergeTimelines, TouchingInstancesStitch)
{
    auto past    = make_timeline({make_object("O", "L1", {make_instance("o0", 0, 10)})});
    auto present = make_timeline({make_object("O", "L1", {make_instance("o1", 10, 20)})});

    MergeResult result = merge_timelines(past, present);

    const auto& inst = instances_of(result.present, "O");
    ASSERT_EQ(inst.size(), 1u);
    EXPECT_DOUBLE_EQ(inst[0].start, 0.0);
    EXPECT_DOUBLE_EQ(*inst[0].end, 20.0);
    EXPECT_EQ(result.past.objects.count("O"), 0u);
    EXPECT_TRUE(result.mismatched_ids.empty());
}

TEST(MergeTimelines, EveryTouchingPresentInstanceWidened)
{
    auto past    = make_timeline({make_object("O", "L1", {make_instance("o0", 0, 10)})});
    auto present = make_timeline(
        {make_object("O", "L1", {make_instance("o1", 10, 20), make_instance("o2", 10, 15)})});

    MergeResult result = merge_timelines(past, present);

    const auto& inst = instances_of(result.present, "O");
    ASSERT_EQ(inst.size(), 2u);
    EXPECT_EQ(inst[0], make_instance("o1", 0, 20));
    EXPECT_EQ(inst[1], make_instance("o2", 0, 15));
    EXPECT_EQ(result.past.objects.count("O"), 0u);
}

TEST(MergeTimelines, GapIsNotStitched)
{
    auto past    = make_timeline({make_object("O", "L1", {make_instance("o0", 0, 9)})});
    auto present = make_timeline({make_object("O", "L1", {make_instance("o1", 10, 20)})});

    MergeResult result = merge_timelines(past, present);

    EXPECT_EQ(instances_of(result.past, "O").size(), 1u);
    EXPECT_DOUBLE_EQ(instances_of(result.present, "O")[0].start, 10.0);
}

TEST(MergeTimelines, OnlyTouchingInstanceRemovedFromPast)
{
    auto past = make_timeline(
        {make_object("O", "L1", {make_instance("o0", 0, 3), make_instance("o1", 5, 10)})});
    auto present = make_timeline({make_object("O", "L1", {make_instance("o2", 10, 12)})});

    MergeResult result = merge_timelines(past, present);

    const auto& left = instances_of(result.past, "O");
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, "o0");
    EXPECT_DOUBLE_EQ(instances_of(result.present, "O")[0].start, 5.0);
}

TEST(MergeTimelines, DifferentDefinitionsReported)
{
    Logger::instance().clear_sinks();
    std::vector<Logger::LogEntry> entries;
    Logger::instance().add_sink([&](const Logger::LogEntry& e) { entries.push_back(e); });

    auto past    = make_timeline({make_object("O", "L1", {make_instance("o0", 0, 10)})});
    auto changed = make_object("O", "L1", {make_instance("o1", 10, 20)});
    changed.object.content["clip"] = "b.mp4";
    auto present = make_timeline({changed});

    MergeResult result = merge_timelines(past, present);

    Logger::instance().clear_sinks();

    ASSERT_EQ(result.mismatched_ids.size(), 1u);
    EXPECT_EQ(result.mismatched_ids[0], "O");
    EXPECT_EQ(instances_of(result.past, "O")[0], make_instance("o0", 0, 10));
    EXPECT_EQ(instances_of(result.present, "O")[0], make_instance("o1", 10, 20));

    bool warned = false;
    for (const auto& e : entries)
        warned = warned || (e.level == LogLevel::Warning && e.category == "merge");
    EXPECT_TRUE(warned);
}

TEST(MergeTimelines, ObjectsInOneScheduleUntouched)
{
    auto past    = make_timeline({make_object("P", "L1", {make_instance("p0", 0, 10)})});
    auto present = make_timeline({make_object("Q", "L2", {make_instance("q0", 10, 20)})});

    MergeResult result = merge_timelines(past, present);

    EXPECT_EQ(result.past, past);
    EXPECT_EQ(result.present, present);
}

TEST(MergeTimelines, OpenEndedPastNeverStitches)
{
    auto past    = make_timeline({make_object("O", "L1", {make_instance("o0", 0, std::nullopt)})});
    auto present = make_timeline({make_object("O", "L1", {make_instance("o1", 10, 20)})});

    MergeResult result = merge_timelines(past, present);

    EXPECT_EQ(result.past, past);
    EXPECT_EQ(result.present, present);
}

TEST(MergeTimelines, TrimThenMergeAtSeam)
{
    auto old_schedule = make_timeline({make_object("O", "L1", {make_instance("o0", 0, 30)})});
    auto new_schedule = make_timeline({make_object("O", "L1", {make_instance("o1", 5, 40)})});

    auto past    = trim_timeline(old_schedule, TrimRange{std::nullopt, 10.0});
    auto present = trim_timeline(new_schedule, TrimRange{10.0, std::nullopt});

    MergeResult result = merge_timelines(past, present);

    EXPECT_TRUE(result.past.objects.empty());
    ASSERT_EQ(instances_of(result.present, "O").size(), 1u);
    EXPECT_DOUBLE_EQ(instances_of(result.present, "O")[0].start, 0.0);
    EXPECT_DOUBLE_EQ(*instances_of(result.present, "O")[0].end, 40.0);
}

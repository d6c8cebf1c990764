#include <gtest/gtest.h>

#include "core/hover_index.hpp"

using namespace tlviz;

namespace
{

DrawState visible_rect(double left, double width, int row, double row_height = 40.0)
{
    DrawState ds;
    ds.left    = left;
    ds.width   = width;
    ds.top     = row * row_height;
    ds.height  = row_height * 0.8;
    ds.visible = true;
    ds.row     = row;
    return ds;
}

class HoverIndexTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        layers_ = {{"a", 0}, {"b", 1}};

        state_[DrawStateKey{0, "A2", "i"}] = visible_rect(500.0, 100.0, 0);
        state_[DrawStateKey{0, "A1", "i"}] = visible_rect(300.0, 50.0, 0);
        state_[DrawStateKey{0, "B1", "i"}] = visible_rect(300.0, 400.0, 1);
        state_[DrawStateKey{0, "H", "i"}]  = DrawState{};   // hidden

        index_.rebuild(state_, layers_);
    }

    LayerMap          layers_;
    TimelineDrawState state_;
    HoverIndex        index_;
};

}   // anonymous namespace

TEST_F(HoverIndexTest, BucketsPerRowSortedByStart)
{
    EXPECT_EQ(index_.row_count(), 2u);
    EXPECT_EQ(index_.span_count(), 3u);

    const auto& row_a = index_.bucket("a");
    ASSERT_EQ(row_a.size(), 2u);
    EXPECT_EQ(row_a[0].key.object_id, "A1");
    EXPECT_DOUBLE_EQ(row_a[0].start_x, 300.0);
    EXPECT_DOUBLE_EQ(row_a[0].end_x, 350.0);
    EXPECT_EQ(row_a[1].key.object_id, "A2");

    EXPECT_EQ(index_.bucket(1).size(), 1u);
    EXPECT_TRUE(index_.bucket("unknown").empty());
    EXPECT_TRUE(index_.bucket(7).empty());
}

TEST_F(HoverIndexTest, HitInsideRectangle)
{
    auto hit = index_.hit_test(320.0, 10.0, 40.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->object_id, "A1");

    hit = index_.hit_test(550.0, 39.0, 40.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->object_id, "A2");
}

TEST_F(HoverIndexTest, EdgesAreInclusive)
{
    EXPECT_TRUE(index_.hit_test(300.0, 5.0, 40.0).has_value());
    EXPECT_TRUE(index_.hit_test(350.0, 5.0, 40.0).has_value());
    EXPECT_FALSE(index_.hit_test(350.5, 5.0, 40.0).has_value());
}

TEST_F(HoverIndexTest, RowChosenFromY)
{
    auto hit = index_.hit_test(550.0, 45.0, 40.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->object_id, "B1");
}

TEST_F(HoverIndexTest, MissOutsideRows)
{
    EXPECT_FALSE(index_.hit_test(320.0, 80.0, 40.0).has_value());
    EXPECT_FALSE(index_.hit_test(320.0, -1.0, 40.0).has_value());
    EXPECT_FALSE(index_.hit_test(100.0, 10.0, 40.0).has_value());
}

TEST_F(HoverIndexTest, ClearDropsEverything)
{
    index_.clear();
    EXPECT_EQ(index_.row_count(), 0u);
    EXPECT_FALSE(index_.hit_test(320.0, 10.0, 40.0).has_value());
}

TEST(HoverIndex, RebuildReplacesPreviousSpans)
{
    HoverIndex        index;
    TimelineDrawState first;
    first[DrawStateKey{0, "A", "i"}] = visible_rect(300.0, 50.0, 0);
    index.rebuild(first, {{"a", 0}});

    TimelineDrawState second;
    second[DrawStateKey{1, "A", "i"}] = visible_rect(600.0, 50.0, 0);
    index.rebuild(second, {{"a", 0}});

    EXPECT_FALSE(index.hit_test(320.0, 10.0, 40.0).has_value());
    auto hit = index.hit_test(620.0, 10.0, 40.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->generation, 1u);
}

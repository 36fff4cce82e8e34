#include <gtest/gtest.h>

#include "convo/sidebar/windowed_list.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace
{

std::vector<std::string> makeKeys(std::size_t count)
{
    std::vector<std::string> keys;
    keys.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        keys.push_back("conv-" + std::to_string(i));
    return keys;
}

void expectSpacersAddUp(const convo::sidebar::WindowedList &list)
{
    const auto window = list.window();
    EXPECT_EQ(window.leadingSpacer + window.materializedHeight + window.trailingSpacer, window.totalHeight);
    EXPECT_EQ(window.totalHeight, list.totalHeight());
}

} // namespace

TEST(WindowedList, EmptySequenceHasNoWindow)
{
    convo::sidebar::WindowedList list(2, 3);
    list.setViewportHeight(10);

    const auto window = list.window();
    EXPECT_TRUE(window.empty);
    EXPECT_EQ(window.count(), 0u);
    EXPECT_EQ(window.totalHeight, 0);
    EXPECT_FALSE(list.nearEnd(5));
}

TEST(WindowedList, UnmeasuredItemsUseTheEstimate)
{
    convo::sidebar::WindowedList list(2, 0);
    list.setKeys(makeKeys(10));

    EXPECT_EQ(list.totalHeight(), 20);
    EXPECT_EQ(list.offsetOf(4), 8);
    EXPECT_EQ(list.heightOf("conv-3"), 2);
    EXPECT_FALSE(list.isMeasured("conv-3"));
}

TEST(WindowedList, MaterializesOnlyTheViewportPlusOverscan)
{
    convo::sidebar::WindowedList list(1, 2);
    list.setKeys(makeKeys(1000));
    list.setViewportHeight(10);
    list.setScrollTop(100);

    const auto window = list.window();
    EXPECT_FALSE(window.empty);
    EXPECT_EQ(window.first, 98u);
    EXPECT_EQ(window.last, 112u);
    EXPECT_EQ(window.leadingSpacer, 98);
    EXPECT_EQ(window.materializedHeight, 14);
    EXPECT_EQ(window.trailingSpacer, 1000 - 112);
    expectSpacersAddUp(list);
}

TEST(WindowedList, ReportedHeightsShiftLaterOffsets)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(6));

    EXPECT_TRUE(list.reportHeight("conv-1", 3));
    EXPECT_EQ(list.offsetOf(2), 4);
    EXPECT_EQ(list.totalHeight(), 8);
    EXPECT_EQ(list.indexAtOffset(0), 0u);
    EXPECT_EQ(list.indexAtOffset(1), 1u);
    EXPECT_EQ(list.indexAtOffset(3), 1u);
    EXPECT_EQ(list.indexAtOffset(4), 2u);
    EXPECT_EQ(list.indexAtOffset(500), 5u);

    EXPECT_FALSE(list.reportHeight("conv-1", 3));
    expectSpacersAddUp(list);
}

TEST(WindowedList, NegativeHeightsClampToZero)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(3));

    list.reportHeight("conv-0", -7);
    EXPECT_EQ(list.heightAt(0), 0);
    EXPECT_EQ(list.heightOf("conv-0"), 0);
    EXPECT_EQ(list.totalHeight(), 2);
    EXPECT_EQ(list.offsetOf(1), 0);
    EXPECT_EQ(list.indexAtOffset(0), 1u);
    EXPECT_EQ(list.indexAtOffset(1), 2u);
}

TEST(WindowedList, ForgottenMeasurementsFallBackToTheEstimate)
{
    convo::sidebar::WindowedList list(2, 0);
    list.setKeys(makeKeys(3));
    list.reportHeight("conv-1", 5);
    list.reportHeight("gone", 4);
    EXPECT_EQ(list.measuredCount(), 2u);
    EXPECT_EQ(list.totalHeight(), 9);

    EXPECT_TRUE(list.forgetMeasurement("gone"));
    EXPECT_TRUE(list.forgetMeasurement("conv-1"));
    EXPECT_FALSE(list.forgetMeasurement("conv-1"));
    EXPECT_EQ(list.measuredCount(), 0u);
    EXPECT_EQ(list.heightAt(1), 2);
    EXPECT_EQ(list.totalHeight(), 6);
    expectSpacersAddUp(list);
}

TEST(WindowedList, MeasurementsSurviveReordering)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys({"a", "b", "c"});
    list.reportHeight("c", 4);

    list.setKeys({"c", "a", "b", "d"});
    EXPECT_EQ(list.heightAt(0), 4);
    EXPECT_EQ(list.offsetOf(1), 4);
    EXPECT_EQ(list.totalHeight(), 7);
    EXPECT_EQ(list.indexOf("c").value_or(99), 0u);
    EXPECT_FALSE(list.indexOf("missing").has_value());
}

TEST(WindowedList, HeightReportedBeforeItemAppearsIsRemembered)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys({"a"});
    EXPECT_FALSE(list.reportHeight("later", 5));

    list.setKeys({"a", "later"});
    EXPECT_EQ(list.heightAt(1), 5);
}

TEST(WindowedList, ScrollTopIsClampedToContent)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(20));
    list.setViewportHeight(5);

    list.setScrollTop(-3);
    EXPECT_EQ(list.scrollTop(), 0);

    list.setScrollTop(100);
    EXPECT_EQ(list.scrollTop(), 15);
    EXPECT_EQ(list.maxScrollTop(), 15);

    list.setKeys(makeKeys(8));
    EXPECT_EQ(list.scrollTop(), 3);

    list.setViewportHeight(50);
    EXPECT_EQ(list.scrollTop(), 0);
}

TEST(WindowedList, ScrollToIndexMovesTheLeastAmount)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(50));
    list.setViewportHeight(10);

    list.scrollToIndex(5);
    EXPECT_EQ(list.scrollTop(), 0);

    list.scrollToIndex(14);
    EXPECT_EQ(list.scrollTop(), 5);

    list.scrollToIndex(2);
    EXPECT_EQ(list.scrollTop(), 2);
}

TEST(WindowedList, NearEndFollowsTheThreshold)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(30));
    list.setViewportHeight(10);

    EXPECT_FALSE(list.nearEnd(3));
    list.setScrollTop(16);
    // Rows 26..29 follow the window.
    EXPECT_FALSE(list.nearEnd(3));
    list.setScrollTop(17);
    EXPECT_TRUE(list.nearEnd(3));
    EXPECT_FALSE(list.nearEnd(2));
}

TEST(WindowedList, ShortListIsNearEndImmediately)
{
    convo::sidebar::WindowedList list(2, 0);
    list.setKeys(makeKeys(3));
    list.setViewportHeight(20);

    const auto window = list.window();
    EXPECT_EQ(window.first, 0u);
    EXPECT_EQ(window.last, 3u);
    EXPECT_EQ(window.trailingSpacer, 0);
    EXPECT_TRUE(list.nearEnd(0));
}

TEST(WindowedList, UnlaidViewportMaterializesNothing)
{
    convo::sidebar::WindowedList list(1, 4);
    list.setKeys(makeKeys(10));

    const auto window = list.window();
    EXPECT_FALSE(window.empty);
    EXPECT_EQ(window.count(), 0u);
    EXPECT_EQ(window.trailingSpacer, 10);
    EXPECT_FALSE(list.nearEnd(100));
}

TEST(WindowedList, ChangingTheEstimateOnlyAffectsUnmeasuredItems)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(4));
    list.reportHeight("conv-0", 5);

    list.setEstimatedItemHeight(3);
    EXPECT_EQ(list.totalHeight(), 5 + 3 * 3);

    list.setEstimatedItemHeight(0);
    EXPECT_EQ(list.estimatedItemHeight(), 1);

    list.clearMeasurements();
    EXPECT_EQ(list.totalHeight(), 4);
}

TEST(WindowedList, VariableHeightsKeepTheWindowConsistent)
{
    convo::sidebar::WindowedList list(2, 1);
    list.setKeys(makeKeys(200));
    list.setViewportHeight(12);
    // Leading, scattered and trailing runs of zero-height rows.
    for (std::size_t i = 0; i < 200; ++i)
    {
        const bool hidden = i < 3 || (i >= 50 && i < 58) || i >= 196 || i % 11 == 0;
        if (hidden)
            list.reportHeight("conv-" + std::to_string(i), 0);
        else if (i % 3 == 0)
            list.reportHeight("conv-" + std::to_string(i), 1 + static_cast<int>(i % 4));
    }

    for (int top = 0; top <= list.maxScrollTop(); ++top)
    {
        list.setScrollTop(top);
        const auto window = list.window();
        ASSERT_LT(window.first, window.last) << "top " << top;
        EXPECT_LE(window.leadingSpacer, top) << "top " << top;
        EXPECT_GE(window.leadingSpacer + window.materializedHeight,
                  std::min(top + list.viewportHeight(), list.totalHeight()))
            << "top " << top;
        expectSpacersAddUp(list);
    }
}

TEST(WindowedList, LeadingZeroHeightRowsDoNotShortenTheWindow)
{
    convo::sidebar::WindowedList list(1, 0);
    list.setKeys(makeKeys(5));
    list.setViewportHeight(1);
    list.reportHeight("conv-0", 0);
    list.reportHeight("conv-1", 0);

    const auto window = list.window();
    EXPECT_EQ(window.leadingSpacer, 0);
    EXPECT_GE(window.materializedHeight, 1);
    EXPECT_TRUE(window.contains(2));
}

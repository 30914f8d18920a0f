#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ui/VirtualScroll.h"

using VirtualScroll::Virtualizer;

namespace {

RenderItem row(const std::string &id, RenderItemType type = RenderItemType::MESSAGE) {
    RenderItem item;
    item.type = type;
    item.id = id;
    return item;
}

std::vector<RenderItem> rows(const std::string &prefix, int count) {
    std::vector<RenderItem> items;
    for (int i = 0; i < count; ++i) {
        items.push_back(row(prefix + std::to_string(i)));
    }
    return items;
}

// Rows named "new*" are 30px, everything else 40px.
int fixedEstimate(const RenderItem &item) { return item.id.rfind("new", 0) == 0 ? 30 : 40; }

Virtualizer makeVirtualizer(std::vector<RenderItem> items, int viewport = 400, int overscan = 5) {
    Virtualizer virtualizer(overscan, 10);
    virtualizer.setEstimator(fixedEstimate);
    virtualizer.setViewportHeight(viewport);
    virtualizer.setItems(std::move(items));
    return virtualizer;
}

int viewportTopOf(const Virtualizer &virtualizer, const std::string &id) {
    auto index = virtualizer.indexOf(id);
    return virtualizer.offsetAt(*index) - virtualizer.scrollOffset();
}

} // namespace

TEST(VirtualScroll, CalculatesVisibleAndRenderedRanges) {
    std::vector<int> offsets;
    std::vector<int> heights(10, 50);
    for (int i = 0; i < 10; ++i) {
        offsets.push_back(i * 50);
    }

    auto range = VirtualScroll::calculateRange(100, 120, offsets, heights, 1);

    EXPECT_EQ(range.firstVisible, 2);
    EXPECT_EQ(range.lastVisible, 4);
    EXPECT_EQ(range.renderFirst, 1);
    EXPECT_EQ(range.renderLast, 5);
}

TEST(VirtualScroll, OverscanIsClampedToSequence) {
    std::vector<int> offsets = {0, 50, 100};
    std::vector<int> heights = {50, 50, 50};

    auto range = VirtualScroll::calculateRange(0, 60, offsets, heights, 90);

    EXPECT_EQ(range.firstVisible, 0);
    EXPECT_EQ(range.lastVisible, 1);
    EXPECT_EQ(range.renderFirst, 0);
    EXPECT_EQ(range.renderLast, 2);
}

TEST(VirtualScroll, EmptySequenceHasEmptyRange) {
    auto range = VirtualScroll::calculateRange(0, 400, {}, {}, 90);
    EXPECT_TRUE(range.empty());
    EXPECT_LT(range.renderLast, range.renderFirst);
}

TEST(VirtualScroll, ExtentUsesEstimatesUntilMeasured) {
    auto virtualizer = makeVirtualizer(rows("m", 10));
    EXPECT_EQ(virtualizer.totalHeight(), 400);

    EXPECT_TRUE(virtualizer.measure("m3", 100));
    EXPECT_EQ(virtualizer.heightAt(3), 100);
    EXPECT_EQ(virtualizer.offsetAt(4), 3 * 40 + 100);
    EXPECT_EQ(virtualizer.totalHeight(), 460);

    EXPECT_FALSE(virtualizer.measure("m3", 100));
}

TEST(VirtualScroll, FailedMeasurementFallsBackToEstimate) {
    auto virtualizer = makeVirtualizer(rows("m", 4));
    virtualizer.measure("m1", 90);

    virtualizer.measurementFailed("m1");
    EXPECT_EQ(virtualizer.heightAt(1), 40);

    virtualizer.measure("m2", 70);
    EXPECT_TRUE(virtualizer.measure("m2", 0));
    EXPECT_EQ(virtualizer.heightAt(2), 40);
    EXPECT_FALSE(virtualizer.heightCache().hasMeasured("m2"));
}

TEST(VirtualScroll, MeasurementsFollowIdsAcrossPrepends) {
    auto virtualizer = makeVirtualizer(rows("m", 5));
    virtualizer.measure("m2", 120);

    auto items = rows("new", 3);
    auto old = rows("m", 5);
    items.insert(items.end(), old.begin(), old.end());
    virtualizer.setItems(items);

    EXPECT_EQ(virtualizer.heightAt(*virtualizer.indexOf("m2")), 120);
    EXPECT_EQ(virtualizer.heightAt(2), 30);
}

TEST(VirtualScroll, DropsMeasurementsOfRemovedItems) {
    auto virtualizer = makeVirtualizer(rows("m", 5));
    virtualizer.measure("m4", 120);

    virtualizer.setItems(rows("m", 4));
    EXPECT_FALSE(virtualizer.heightCache().hasMeasured("m4"));

    virtualizer.setItems(rows("m", 5));
    EXPECT_EQ(virtualizer.heightAt(4), 40);
}

TEST(VirtualScroll, AnchorIsSecondVisibleItem) {
    auto virtualizer = makeVirtualizer(rows("m", 100));
    virtualizer.setScrollOffset(2010);

    auto anchor = virtualizer.captureAnchor();

    ASSERT_TRUE(anchor.has_value());
    EXPECT_EQ(anchor->id, "m51");
    EXPECT_EQ(anchor->viewportTop, 30);
}

TEST(VirtualScroll, AnchorStaysPutWhenItemsArePrepended) {
    auto virtualizer = makeVirtualizer(rows("m", 100));
    virtualizer.setScrollOffset(2000);
    auto anchor = virtualizer.captureAnchor();
    ASSERT_TRUE(anchor.has_value());
    const int before = viewportTopOf(virtualizer, anchor->id);

    auto items = rows("new", 10);
    auto old = rows("m", 100);
    items.insert(items.end(), old.begin(), old.end());
    virtualizer.setItems(items);
    ASSERT_TRUE(virtualizer.restoreAnchor(*anchor));

    EXPECT_EQ(viewportTopOf(virtualizer, anchor->id), before);
    EXPECT_EQ(virtualizer.scrollOffset(), 2000 + 10 * 30);
}

TEST(VirtualScroll, AnchorStaysPutWhenRowsAboveAreMeasured) {
    auto virtualizer = makeVirtualizer(rows("m", 100));
    virtualizer.setScrollOffset(2000);
    auto anchor = virtualizer.captureAnchor();
    ASSERT_TRUE(anchor.has_value());

    virtualizer.measure("m10", 140);
    virtualizer.measure("m11", 15);
    ASSERT_TRUE(virtualizer.restoreAnchor(*anchor));

    EXPECT_EQ(viewportTopOf(virtualizer, anchor->id), anchor->viewportTop);
}

TEST(VirtualScroll, LostAnchorLeavesScrollAlone) {
    auto virtualizer = makeVirtualizer(rows("m", 100));
    virtualizer.setScrollOffset(1000);
    auto anchor = virtualizer.captureAnchor();
    ASSERT_TRUE(anchor.has_value());

    virtualizer.setItems(rows("other", 100));

    EXPECT_FALSE(virtualizer.restoreAnchor(*anchor));
    EXPECT_EQ(virtualizer.scrollOffset(), 1000);
}

TEST(VirtualScroll, NoAnchorWithoutItems) {
    auto virtualizer = makeVirtualizer({});
    EXPECT_FALSE(virtualizer.captureAnchor().has_value());
}

TEST(VirtualScroll, ScrollOffsetIsClamped) {
    auto virtualizer = makeVirtualizer(rows("m", 20));

    virtualizer.setScrollOffset(-50);
    EXPECT_EQ(virtualizer.scrollOffset(), 0);

    virtualizer.setScrollOffset(100000);
    EXPECT_EQ(virtualizer.scrollOffset(), 800 - 400);
    EXPECT_TRUE(virtualizer.isAtBottom());
}

TEST(VirtualScroll, ScrollToIndexPlacesItemAtViewportFraction) {
    auto virtualizer = makeVirtualizer(rows("m", 100));

    ASSERT_TRUE(virtualizer.scrollToIndex(20, 0.25));
    EXPECT_EQ(virtualizer.scrollOffset(), 800 - 100);
    EXPECT_EQ(viewportTopOf(virtualizer, "m20"), 100);

    EXPECT_FALSE(virtualizer.scrollToIndex(100, 0.0));
}

TEST(VirtualScroll, ScrollToUnreadTargetsSeparator) {
    auto items = rows("m", 50);
    EXPECT_FALSE(makeVirtualizer(items).scrollToUnread(0.0));

    items.insert(items.begin() + 30, row("start-of-new-messages-1", RenderItemType::UNREAD_SEPARATOR));
    auto virtualizer = makeVirtualizer(items);

    ASSERT_TRUE(virtualizer.scrollToUnread(0.0));
    EXPECT_EQ(virtualizer.scrollOffset(), 30 * 40);
}

TEST(VirtualScroll, IntentsReflectVisibleRows) {
    auto items = rows("m", 50);
    items.insert(items.begin(), row(RenderItemIds::LOAD_OLDER, RenderItemType::LOAD_MORE));
    auto virtualizer = makeVirtualizer(items);

    auto top = virtualizer.intents();
    EXPECT_TRUE(top.requestOlderPage);
    EXPECT_FALSE(top.requestNewerPage);
    EXPECT_FALSE(top.atBottom);

    virtualizer.scrollToBottom();
    auto bottom = virtualizer.intents();
    EXPECT_FALSE(bottom.requestOlderPage);
    EXPECT_TRUE(bottom.atBottom);
}

TEST(VirtualScroll, IntentsReportUnreadBoundaryAndNewerPage) {
    auto items = rows("m", 5);
    items.push_back(row("start-of-new-messages-1", RenderItemType::UNREAD_SEPARATOR));
    RenderItem newer = row(RenderItemIds::LOAD_NEWER, RenderItemType::LOAD_MORE);
    newer.direction = LoadDirection::NEWER;
    items.push_back(newer);

    auto intents = makeVirtualizer(items).intents();

    EXPECT_TRUE(intents.reachedUnreadBoundary);
    EXPECT_TRUE(intents.requestNewerPage);
}

TEST(VirtualScroll, InvalidateReestimatesRow) {
    int editorHeight = 40;
    Virtualizer virtualizer(5, 10);
    virtualizer.setEstimator([&editorHeight](const RenderItem &item) { return item.id == "m1" ? editorHeight : 40; });
    virtualizer.setViewportHeight(400);
    virtualizer.setItems(rows("m", 3));
    virtualizer.measure("m1", 55);

    editorHeight = 340;
    virtualizer.invalidate("m1");

    EXPECT_EQ(virtualizer.heightAt(1), 340);
}

TEST(VirtualScroll, ClearMeasurementsAppliesNewEstimates) {
    int estimate = 40;
    Virtualizer virtualizer(5, 10);
    virtualizer.setEstimator([&estimate](const RenderItem &) { return estimate; });
    virtualizer.setViewportHeight(400);
    virtualizer.setItems(rows("m", 4));
    virtualizer.measure("m0", 90);

    // A narrower view wraps text into more lines.
    estimate = 60;
    virtualizer.clearMeasurements();

    EXPECT_EQ(virtualizer.heightCache().size(), 0u);
    EXPECT_EQ(virtualizer.heightAt(0), 60);
    EXPECT_EQ(virtualizer.totalHeight(), 240);
}

TEST(VirtualScroll, ResetDiscardsEverything) {
    auto virtualizer = makeVirtualizer(rows("m", 30));
    virtualizer.measure("m0", 90);
    virtualizer.setScrollOffset(200);

    virtualizer.reset();

    EXPECT_TRUE(virtualizer.items().empty());
    EXPECT_EQ(virtualizer.heightCache().size(), 0u);
    EXPECT_EQ(virtualizer.scrollOffset(), 0);
    EXPECT_EQ(virtualizer.totalHeight(), 0);
}

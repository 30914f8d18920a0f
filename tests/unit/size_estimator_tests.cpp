#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "TestSupport.h"
#include "ui/LayoutConstants.h"
#include "ui/SizeEstimator.h"

using SizeEstimator::EstimateContext;
using SizeEstimator::WidthClass;

namespace {

RenderItem messageItem(const Message &message, bool showHeader = true, bool own = false) {
    RenderItem item;
    item.type = RenderItemType::MESSAGE;
    item.id = message.id;
    item.message = std::make_shared<const Message>(message);
    item.showHeader = showHeader;
    item.grouped = !showHeader;
    item.isOwnMessage = own;
    return item;
}

RenderItem marker(RenderItemType type) {
    RenderItem item;
    item.type = type;
    item.id = "marker";
    return item;
}

EstimateContext regular() { return EstimateContext{}; }

EstimateContext compact() {
    EstimateContext context;
    context.widthClass = WidthClass::COMPACT;
    return context;
}

} // namespace

TEST(SizeEstimator, FixedHeightsForMarkers) {
    EXPECT_EQ(SizeEstimator::estimate(marker(RenderItemType::DATE_SEPARATOR), regular()), 60);
    EXPECT_EQ(SizeEstimator::estimate(marker(RenderItemType::UNREAD_SEPARATOR), regular()), 50);
    EXPECT_EQ(SizeEstimator::estimate(marker(RenderItemType::LOAD_MORE), regular()), 60);
    EXPECT_EQ(SizeEstimator::estimate(marker(RenderItemType::LOADING), regular()), 80);
    EXPECT_EQ(SizeEstimator::estimate(marker(RenderItemType::START_OF_CONVERSATION), regular()), 200);
}

TEST(SizeEstimator, HeaderAllowanceOnlyForOthersUngroupedMessages) {
    Message message = TestSupport::makeMessage("m1", "a", 0, "c1", "");

    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, true, false), regular()), 100);
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false, false), regular()), 50);
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, true, true), regular()), 50);
}

TEST(SizeEstimator, TextLinesDependOnWidthClass) {
    Message message = TestSupport::makeMessage("m1", "a", 0, "c1", std::string(141, 'x'));

    EXPECT_EQ(SizeEstimator::estimateTextLines(message, WidthClass::REGULAR), 2);
    EXPECT_EQ(SizeEstimator::estimateTextLines(message, WidthClass::COMPACT), 6);
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), regular()), 50 + 2 * 20);
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), compact()), 50 + 6 * 20);
}

TEST(SizeEstimator, LineBreaksAddLines) {
    Message message = TestSupport::makeMessage("m1", "a", 0, "c1", "a\nb");

    EXPECT_EQ(SizeEstimator::estimateTextLines(message, WidthClass::REGULAR), 3);
}

TEST(SizeEstimator, EditorOverridesTextEstimate) {
    Message message = TestSupport::makeMessage("m1", "a", 0, "c1", std::string(500, 'x'));
    EstimateContext context;
    context.editingMessageId = "m1";

    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), context), 50 + 300);

    context.editingMessageId = "m2";
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), context), 50 + 4 * 20);
}

TEST(SizeEstimator, ReactionsRepliesAndAttachments) {
    Message message = TestSupport::makeMessage("m1", "a", 0, "c1", "");
    Reaction reaction;
    reaction.userId = "b";
    reaction.postId = "m1";
    reaction.emojiName = "tada";
    message.reactions.push_back(reaction);
    message.replyCount = 3;

    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), regular()), 50 + 50 + 40);

    Attachment file;
    file.id = "f1";
    message.attachments = {file, file};
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), regular()), 50 + 50 + 40 + 80 + 8 + 16);
    EXPECT_EQ(SizeEstimator::estimate(messageItem(message, false), compact()), 50 + 50 + 40 + 2 * 88 + 8);
}

TEST(SizeEstimator, MessageItemWithoutRecordUsesDefault) {
    EXPECT_EQ(SizeEstimator::estimate(marker(RenderItemType::MESSAGE), regular()),
              LayoutConstants::kDefaultItemHeight);
}

TEST(SizeEstimator, WidthClassFollowsBreakpoint) {
    EXPECT_EQ(SizeEstimator::widthClassFor(599, 600), WidthClass::COMPACT);
    EXPECT_EQ(SizeEstimator::widthClassFor(600, 600), WidthClass::REGULAR);
}

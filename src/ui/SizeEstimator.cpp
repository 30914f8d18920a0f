#include "ui/SizeEstimator.h"

#include "ui/LayoutConstants.h"

namespace SizeEstimator {

namespace {

int estimateAttachments(const Message &message, WidthClass widthClass) {
    if (message.attachments.empty()) {
        return 0;
    }
    if (widthClass == WidthClass::COMPACT) {
        return static_cast<int>(message.attachments.size()) * LayoutConstants::kAttachmentStackedHeight +
               LayoutConstants::kAttachmentSpacing;
    }
    return LayoutConstants::kAttachmentHeight + LayoutConstants::kAttachmentSpacing +
           LayoutConstants::kAttachmentRowMargin;
}

int estimateMessage(const RenderItem &item, const EstimateContext &context) {
    const Message &message = *item.message;
    int height = LayoutConstants::kMessageBaseHeight;

    if (item.showHeader && !item.isOwnMessage) {
        height += LayoutConstants::kMessageHeaderHeight;
    }

    if (!context.editingMessageId.empty() && context.editingMessageId == message.id) {
        height += LayoutConstants::kMessageEditorHeight;
    } else {
        height += estimateTextLines(message, context.widthClass) * LayoutConstants::kMessageLineHeight;
    }

    if (!message.reactions.empty()) {
        height += LayoutConstants::kReactionRowHeight;
    }
    if (message.replyCount > 0) {
        height += LayoutConstants::kReplyCountRowHeight;
    }

    return height + estimateAttachments(message, context.widthClass);
}

} // namespace

int estimateTextLines(const Message &message, WidthClass widthClass) {
    int charsPerLine = widthClass == WidthClass::COMPACT ? LayoutConstants::kCharsPerLineCompact
                                                         : LayoutConstants::kCharsPerLineRegular;
    int length = static_cast<int>(message.content.size());
    int lines = (length + charsPerLine - 1) / charsPerLine;

    int breaks = message.lineBreakCount();
    if (breaks > 0) {
        lines += breaks + 1;
    }
    return lines;
}

WidthClass widthClassFor(int viewWidth, int compactBreakpoint) {
    return viewWidth < compactBreakpoint ? WidthClass::COMPACT : WidthClass::REGULAR;
}

int estimate(const RenderItem &item, const EstimateContext &context) {
    switch (item.type) {
    case RenderItemType::MESSAGE:
        if (item.message) {
            return estimateMessage(item, context);
        }
        return LayoutConstants::kDefaultItemHeight;
    case RenderItemType::DATE_SEPARATOR:
        return LayoutConstants::kDateSeparatorHeight;
    case RenderItemType::UNREAD_SEPARATOR:
        return LayoutConstants::kUnreadSeparatorHeight;
    case RenderItemType::LOAD_MORE:
        return LayoutConstants::kLoadMoreHeight;
    case RenderItemType::LOADING:
        return LayoutConstants::kLoadingHeight;
    case RenderItemType::START_OF_CONVERSATION:
        return LayoutConstants::kStartOfConversationHeight;
    }
    return LayoutConstants::kDefaultItemHeight;
}

} // namespace SizeEstimator

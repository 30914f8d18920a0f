#pragma once

namespace LayoutConstants {

// Row estimates used before an item has been drawn once.
constexpr int kLoadMoreHeight = 60;
constexpr int kLoadingHeight = 80;
constexpr int kDateSeparatorHeight = 60;
constexpr int kUnreadSeparatorHeight = 50;
constexpr int kStartOfConversationHeight = 200;
constexpr int kDefaultItemHeight = 60;

constexpr int kMessageBaseHeight = 50;
constexpr int kMessageHeaderHeight = 50;
constexpr int kMessageEditorHeight = 300;
constexpr int kMessageLineHeight = 20;
constexpr int kCharsPerLineRegular = 140;
constexpr int kCharsPerLineCompact = 26;
constexpr int kReactionRowHeight = 50;
constexpr int kReplyCountRowHeight = 40;

constexpr int kAttachmentHeight = 80;
constexpr int kAttachmentStackedHeight = 88;
constexpr int kAttachmentSpacing = 8;
constexpr int kAttachmentRowMargin = 16;

// Drawing metrics of the message list.
constexpr int kUserAvatarSize = 34;
constexpr int kMessagePaddingX = 16;
constexpr int kMessagePaddingY = 6;
constexpr int kMessageContentIndent = 58;
constexpr int kTypingBarHeight = 24;
constexpr int kScrollbarWidth = 10;
constexpr int kCornerRadius = 8;

constexpr int kMessageFontSize = 14;
constexpr int kHeaderFontSize = 15;
constexpr int kMetaFontSize = 11;

constexpr int kWheelStep = 40;

} // namespace LayoutConstants

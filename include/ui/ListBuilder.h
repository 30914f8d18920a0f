#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "models/Channel.h"
#include "models/RenderItem.h"
#include "state/AppState.h"
#include "state/Selectors.h"

/**
 * Turns a conversation's stored order into the rows the list displays.
 * Every pass is a pure function; the same inputs always yield equal output.
 */
namespace ListBuilder {

struct BuildOptions {
    Viewer viewer;
    ChannelType channelType = ChannelType::OPEN;
    bool showJoinLeave = true;
    std::chrono::milliseconds groupingWindow{5 * 60 * 1000};
};

/**
 * @brief Message rows and date separators in display order (oldest first)
 *
 * orderedIds is most-recent-first. IDs without a record (markers included) are skipped,
 * hidden join/leave messages are dropped, and the remaining order is kept as stored
 * (read from the tail). A date separator opens every local calendar day. A message is grouped when the
 * previous row is a non-system message by the same author, created less than the
 * grouping window earlier. Direct conversations never show headers.
 */
std::vector<RenderItem> build(const std::vector<std::string> &orderedIds, const MessageMap &messagesById,
                              const BuildOptions &options);

/**
 * @brief Check whether a join/leave message is hidden for this viewer
 * Hidden only when the preference is off and neither the message nor any post it
 * aggregates references the viewer.
 */
bool isHiddenJoinLeave(const Message &message, const BuildOptions &options);

/**
 * @brief Add the head row (start of conversation, loading or load-more) and the tail load-more row
 */
std::vector<RenderItem> injectLoaders(std::vector<RenderItem> items, bool atOldestBoundary, bool atNewestBoundary,
                                      LoadingState loading);

/**
 * @brief Insert the unread separator before the first message newer than lastViewedAt
 * No-op when unreadCount is zero or no message is newer. The message after the separator
 * starts a new group and shows its header unless the conversation is direct.
 */
std::vector<RenderItem> injectUnreadSeparator(std::vector<RenderItem> items,
                                              std::chrono::system_clock::time_point lastViewedAt, int unreadCount,
                                              ChannelType channelType = ChannelType::OPEN);

/**
 * @brief build, injectLoaders and injectUnreadSeparator over one conversation's inputs
 */
std::vector<RenderItem> buildFeed(const FeedInputs &inputs, std::chrono::milliseconds groupingWindow);

/**
 * @brief Index of the unread separator, std::nullopt if absent
 */
std::optional<size_t> findUnreadSeparator(const std::vector<RenderItem> &items);

} // namespace ListBuilder

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "state/AppState.h"

/**
 * @brief Everything the list builder reads for one conversation
 *
 * Message records compare by pointer, so an unchanged record never triggers a rebuild.
 */
struct FeedInputs {
    std::string channelId;
    std::vector<std::string> order;
    MessageMap messages; ///< Records referenced by order only
    Viewer viewer;
    ChannelType channelType = ChannelType::OPEN;
    bool showJoinLeave = true;
    bool atOldestBoundary = false;
    bool atNewestBoundary = false;
    LoadingState loading = LoadingState::NONE;
    std::chrono::system_clock::time_point lastViewedAt{};
    int unreadCount = 0;

    bool operator==(const FeedInputs &other) const {
        return channelId == other.channelId && order == other.order && messages == other.messages &&
               viewer == other.viewer && channelType == other.channelType && showJoinLeave == other.showJoinLeave &&
               atOldestBoundary == other.atOldestBoundary && atNewestBoundary == other.atNewestBoundary &&
               loading == other.loading && lastViewedAt == other.lastViewedAt && unreadCount == other.unreadCount;
    }

    bool operator!=(const FeedInputs &other) const { return !(*this == other); }
};

namespace Selectors {

FeedInputs selectFeedInputs(const AppState &state, const std::string &channelId);

/**
 * @brief Oldest message ID of a most-recent-first order
 * Marker IDs, IDs without a record and pending sends are skipped.
 * @return The ID, std::nullopt if the order holds no message
 */
std::optional<std::string> oldestMessageId(const std::vector<std::string> &order, const MessageMap &messages);

/**
 * @brief Newest message ID of a most-recent-first order, skipping pending sends and markers
 */
std::optional<std::string> newestMessageId(const std::vector<std::string> &order, const MessageMap &messages);

/**
 * @brief Typing signals of a channel not older than the timeout at `now`
 */
std::vector<TypingSignal> activeTypers(const AppState &state, const std::string &channelId,
                                       std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout);

/**
 * @brief Sentence shown under the list ("Ann is typing...")
 * @return Empty string when nobody is typing
 */
std::string typingSummary(const std::vector<TypingSignal> &signals);

/**
 * @brief Resolve a user's display name
 * Prefers the cached profile, then the name carried by the event, then a placeholder.
 */
std::string resolveDisplayName(const AppState &state, const std::string &userId, const std::string &payloadName);

/**
 * @brief Display name of every cached profile under the current name display mode
 */
std::unordered_map<std::string, std::string> displayNames(const AppState &state);

constexpr const char *UNKNOWN_USER_NAME = "Someone";

} // namespace Selectors

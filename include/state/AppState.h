#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "models/Channel.h"
#include "models/Message.h"
#include "models/User.h"

/**
 * @brief Fetch operation in flight for a conversation; only one at a time
 */
enum class LoadingState { NONE, INITIAL, OLDER, NEWER };

/**
 * @brief Pagination and read state of one conversation
 */
struct ChannelPosts {
    std::vector<std::string> order; ///< Message IDs, most recent first, no duplicates
    bool atOldestBoundary = false;  ///< A fetch reported no older page
    bool atNewestBoundary = false;  ///< A fetch reported no newer page
    std::chrono::system_clock::time_point lastViewedAt{};
    int unreadCount = 0;
    LoadingState loading = LoadingState::NONE;
    uint64_t loadingGeneration = 0; ///< View generation of the fetch in flight

    bool operator==(const ChannelPosts &other) const {
        return order == other.order && atOldestBoundary == other.atOldestBoundary &&
               atNewestBoundary == other.atNewestBoundary && lastViewedAt == other.lastViewedAt &&
               unreadCount == other.unreadCount && loading == other.loading;
    }

    bool operator!=(const ChannelPosts &other) const { return !(*this == other); }
};

/**
 * @brief Someone else is typing in a conversation
 */
struct TypingSignal {
    std::string channelId;
    std::string userId;
    std::string displayName;
    std::chrono::steady_clock::time_point timestamp;

    bool operator==(const TypingSignal &other) const {
        return channelId == other.channelId && userId == other.userId && displayName == other.displayName &&
               timestamp == other.timestamp;
    }

    bool operator!=(const TypingSignal &other) const { return !(*this == other); }
};

struct Viewer {
    std::string id;
    std::string username;

    bool operator==(const Viewer &other) const { return id == other.id && username == other.username; }
    bool operator!=(const Viewer &other) const { return !(*this == other); }
};

struct Preferences {
    bool showJoinLeave = true;
    NameDisplay nameDisplay = NameDisplay::FullNameNickname;

    bool operator==(const Preferences &other) const {
        return showJoinLeave == other.showJoinLeave && nameDisplay == other.nameDisplay;
    }
    bool operator!=(const Preferences &other) const { return !(*this == other); }
};

/**
 * @brief Conversation currently shown; generation changes on every navigation
 * Fetches are tagged with the generation active at dispatch time.
 */
struct ViewContext {
    std::string channelId;
    uint64_t generation = 0;

    bool operator==(const ViewContext &other) const {
        return channelId == other.channelId && generation == other.generation;
    }
    bool operator!=(const ViewContext &other) const { return !(*this == other); }
};

using MessageMap = std::unordered_map<std::string, MessagePtr>;

struct AppState {
    Viewer viewer;
    Preferences preferences;
    ViewContext view;

    MessageMap messages;
    std::unordered_map<std::string, ChannelPosts> channelPosts;
    std::unordered_map<std::string, Channel> channels;
    std::unordered_map<std::string, User> users;
    std::unordered_map<std::string, std::vector<TypingSignal>> typingByChannel;
};

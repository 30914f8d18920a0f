#include "state/Selectors.h"

#include <unordered_set>

#include "models/RenderItem.h"

namespace Selectors {

FeedInputs selectFeedInputs(const AppState &state, const std::string &channelId) {
    FeedInputs inputs;
    inputs.channelId = channelId;
    inputs.viewer = state.viewer;
    inputs.showJoinLeave = state.preferences.showJoinLeave;

    auto channelIt = state.channels.find(channelId);
    if (channelIt != state.channels.end()) {
        inputs.channelType = channelIt->second.type;
    }

    auto postsIt = state.channelPosts.find(channelId);
    if (postsIt == state.channelPosts.end()) {
        return inputs;
    }

    const auto &posts = postsIt->second;
    inputs.order = posts.order;
    inputs.atOldestBoundary = posts.atOldestBoundary;
    inputs.atNewestBoundary = posts.atNewestBoundary;
    inputs.loading = posts.loading;
    inputs.lastViewedAt = posts.lastViewedAt;
    inputs.unreadCount = posts.unreadCount;

    inputs.messages.reserve(posts.order.size());
    for (const auto &id : posts.order) {
        auto it = state.messages.find(id);
        if (it != state.messages.end()) {
            inputs.messages.emplace(id, it->second);
        }
    }

    return inputs;
}

std::optional<std::string> oldestMessageId(const std::vector<std::string> &order, const MessageMap &messages) {
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (RenderItemIds::isMarker(*it)) {
            continue;
        }
        auto found = messages.find(*it);
        if (found != messages.end() && !found->second->pending) {
            return *it;
        }
    }
    return std::nullopt;
}

std::optional<std::string> newestMessageId(const std::vector<std::string> &order, const MessageMap &messages) {
    for (const auto &id : order) {
        if (RenderItemIds::isMarker(id)) {
            continue;
        }
        auto found = messages.find(id);
        if (found != messages.end() && !found->second->pending) {
            return id;
        }
    }
    return std::nullopt;
}

std::vector<TypingSignal> activeTypers(const AppState &state, const std::string &channelId,
                                       std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout) {
    std::vector<TypingSignal> active;
    auto it = state.typingByChannel.find(channelId);
    if (it == state.typingByChannel.end()) {
        return active;
    }

    for (const auto &signal : it->second) {
        if (signal.userId == state.viewer.id) {
            continue;
        }
        if (now - signal.timestamp <= timeout) {
            active.push_back(signal);
        }
    }
    return active;
}

std::string typingSummary(const std::vector<TypingSignal> &signals) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto &signal : signals) {
        if (seen.insert(signal.displayName).second) {
            names.push_back(signal.displayName);
        }
    }

    if (names.empty()) {
        return "";
    }
    if (names.size() == 1) {
        return names[0] + " is typing...";
    }
    if (names.size() == 2) {
        return names[0] + " and " + names[1] + " are typing...";
    }
    return "Several people are typing...";
}

std::string resolveDisplayName(const AppState &state, const std::string &userId, const std::string &payloadName) {
    auto it = state.users.find(userId);
    if (it != state.users.end()) {
        std::string name = it->second.getDisplayName(state.preferences.nameDisplay);
        if (!name.empty()) {
            return name;
        }
    }
    if (!payloadName.empty()) {
        return payloadName;
    }
    return UNKNOWN_USER_NAME;
}

std::unordered_map<std::string, std::string> displayNames(const AppState &state) {
    std::unordered_map<std::string, std::string> names;
    names.reserve(state.users.size());
    for (const auto &[id, user] : state.users) {
        names.emplace(id, user.getDisplayName(state.preferences.nameDisplay));
    }
    return names;
}

} // namespace Selectors

#include "state/Actions.h"

#include <algorithm>
#include <atomic>
#include <unordered_set>

#include "utils/Logger.h"
#include "utils/Time.h"

namespace Actions {

namespace {

LoadingState loadingStateFor(Feed::FetchDirection direction) {
    switch (direction) {
    case Feed::FetchDirection::OLDER:
        return LoadingState::OLDER;
    case Feed::FetchDirection::NEWER:
        return LoadingState::NEWER;
    case Feed::FetchDirection::INITIAL:
    default:
        return LoadingState::INITIAL;
    }
}

bool isStale(const AppState &state, const Feed::FetchRequest &request) {
    return request.generation != state.view.generation || request.channelId != state.view.channelId;
}

void clearLoading(ChannelPosts &posts, const Feed::FetchRequest &request) {
    if (posts.loadingGeneration == request.generation && posts.loading == loadingStateFor(request.direction)) {
        posts.loading = LoadingState::NONE;
    }
}

std::vector<std::string> uniqueIds(const std::vector<Message> &messages, const std::unordered_set<std::string> &skip) {
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    ids.reserve(messages.size());
    for (const auto &message : messages) {
        if (skip.count(message.id) > 0 || !seen.insert(message.id).second) {
            continue;
        }
        ids.push_back(message.id);
    }
    return ids;
}

MessagePtr findMessage(const AppState &state, const std::string &id) {
    auto it = state.messages.find(id);
    return it != state.messages.end() ? it->second : nullptr;
}

} // namespace

uint64_t setActiveChannel(AppState &state, const std::string &channelId) {
    state.view.channelId = channelId;
    state.view.generation += 1;

    auto &posts = state.channelPosts[channelId];
    posts.loading = LoadingState::NONE;

    return state.view.generation;
}

bool beginFetch(AppState &state, const Feed::FetchRequest &request) {
    if (isStale(state, request)) {
        return false;
    }

    auto &posts = state.channelPosts[request.channelId];
    if (posts.loading != LoadingState::NONE) {
        return false;
    }
    if (request.direction == Feed::FetchDirection::OLDER && posts.atOldestBoundary) {
        return false;
    }
    if (request.direction == Feed::FetchDirection::NEWER && posts.atNewestBoundary) {
        return false;
    }

    posts.loading = loadingStateFor(request.direction);
    posts.loadingGeneration = request.generation;
    return true;
}

bool applyFetchResult(AppState &state, const Feed::FetchRequest &request, const Feed::FetchResult &result) {
    auto &posts = state.channelPosts[request.channelId];
    clearLoading(posts, request);

    if (isStale(state, request)) {
        Logger::debug("Actions: discarding " + std::string(Feed::toString(request.direction)) + " page for " +
                      request.channelId + " from generation " + std::to_string(request.generation));
        return false;
    }

    for (const auto &message : result.messages) {
        state.messages[message.id] = std::make_shared<const Message>(message);
    }

    switch (request.direction) {
    case Feed::FetchDirection::INITIAL:
        posts.order = uniqueIds(result.messages, {});
        break;

    case Feed::FetchDirection::OLDER: {
        std::unordered_set<std::string> existing(posts.order.begin(), posts.order.end());
        auto older = uniqueIds(result.messages, existing);
        posts.order.insert(posts.order.end(), older.begin(), older.end());
        break;
    }

    case Feed::FetchDirection::NEWER: {
        std::unordered_set<std::string> existing(posts.order.begin(), posts.order.end());
        auto newer = uniqueIds(result.messages, existing);
        posts.order.insert(posts.order.begin(), newer.begin(), newer.end());
        break;
    }
    }

    if (result.atOldestBoundary.has_value()) {
        posts.atOldestBoundary = *result.atOldestBoundary;
    }
    if (result.atNewestBoundary.has_value()) {
        posts.atNewestBoundary = *result.atNewestBoundary;
    }

    return true;
}

void failFetch(AppState &state, const Feed::FetchRequest &request) {
    auto it = state.channelPosts.find(request.channelId);
    if (it != state.channelPosts.end()) {
        clearLoading(it->second, request);
    }
}

bool upsertMessage(AppState &state, const Message &message) {
    auto record = std::make_shared<const Message>(message);
    state.messages[message.id] = record;

    if (message.isReply()) {
        return false;
    }

    auto &posts = state.channelPosts[message.channelId];
    auto &order = posts.order;

    if (std::find(order.begin(), order.end(), message.id) != order.end()) {
        return false;
    }

    if (message.pendingPostId.has_value()) {
        auto pendingIt = std::find(order.begin(), order.end(), *message.pendingPostId);
        if (pendingIt != order.end()) {
            *pendingIt = message.id;
            state.messages.erase(*message.pendingPostId);
            return true;
        }
    }

    if (!posts.atNewestBoundary) {
        return false;
    }

    order.insert(order.begin(), message.id);
    return true;
}

MessagePtr removeMessage(AppState &state, const std::string &messageId) {
    auto it = state.messages.find(messageId);
    if (it == state.messages.end()) {
        return nullptr;
    }

    MessagePtr removed = it->second;
    state.messages.erase(it);

    auto postsIt = state.channelPosts.find(removed->channelId);
    if (postsIt != state.channelPosts.end()) {
        auto &order = postsIt->second.order;
        order.erase(std::remove(order.begin(), order.end(), messageId), order.end());
    }

    return removed;
}

void addPendingMessage(AppState &state, Message message) {
    message.pending = true;
    message.failed = false;

    auto &order = state.channelPosts[message.channelId].order;
    if (std::find(order.begin(), order.end(), message.id) == order.end()) {
        order.insert(order.begin(), message.id);
    }
    state.messages[message.id] = std::make_shared<const Message>(std::move(message));
}

std::string generatePendingId() {
    static std::atomic<uint64_t> counter{0};
    const auto ms = TimeUtils::toUnixMs(std::chrono::system_clock::now());
    return "pending_" + std::to_string(ms) + "_" + std::to_string(++counter);
}

bool markMessageFailed(AppState &state, const std::string &messageId) {
    MessagePtr existing = findMessage(state, messageId);
    if (!existing) {
        return false;
    }

    Message updated = *existing;
    updated.failed = true;
    state.messages[messageId] = std::make_shared<const Message>(std::move(updated));
    return true;
}

void markAsRead(AppState &state, const std::string &channelId, std::chrono::system_clock::time_point now) {
    auto &posts = state.channelPosts[channelId];
    posts.lastViewedAt = now;
    posts.unreadCount = 0;
}

bool addReaction(AppState &state, const Reaction &reaction) {
    MessagePtr existing = findMessage(state, reaction.postId);
    if (!existing) {
        return false;
    }
    if (std::find(existing->reactions.begin(), existing->reactions.end(), reaction) != existing->reactions.end()) {
        return false;
    }

    Message updated = *existing;
    updated.reactions.push_back(reaction);
    state.messages[reaction.postId] = std::make_shared<const Message>(std::move(updated));
    return true;
}

bool removeReaction(AppState &state, const Reaction &reaction) {
    MessagePtr existing = findMessage(state, reaction.postId);
    if (!existing) {
        return false;
    }

    Message updated = *existing;
    auto newEnd = std::remove(updated.reactions.begin(), updated.reactions.end(), reaction);
    if (newEnd == updated.reactions.end()) {
        return false;
    }
    updated.reactions.erase(newEnd, updated.reactions.end());
    state.messages[reaction.postId] = std::make_shared<const Message>(std::move(updated));
    return true;
}

void upsertTyping(AppState &state, const TypingSignal &signal) {
    auto &signals = state.typingByChannel[signal.channelId];
    auto it = std::find_if(signals.begin(), signals.end(),
                           [&signal](const TypingSignal &existing) { return existing.userId == signal.userId; });
    if (it != signals.end()) {
        *it = signal;
    } else {
        signals.push_back(signal);
    }
}

bool removeTyping(AppState &state, const std::string &channelId, const std::string &userId) {
    auto it = state.typingByChannel.find(channelId);
    if (it == state.typingByChannel.end()) {
        return false;
    }

    auto &signals = it->second;
    const size_t before = signals.size();
    signals.erase(std::remove_if(signals.begin(), signals.end(),
                                 [&userId](const TypingSignal &signal) { return signal.userId == userId; }),
                  signals.end());
    const bool removed = signals.size() != before;
    if (signals.empty()) {
        state.typingByChannel.erase(it);
    }
    return removed;
}

size_t sweepTyping(AppState &state, std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout) {
    size_t removed = 0;
    for (auto it = state.typingByChannel.begin(); it != state.typingByChannel.end();) {
        auto &signals = it->second;
        const size_t before = signals.size();
        signals.erase(std::remove_if(signals.begin(), signals.end(),
                                     [now, timeout](const TypingSignal &signal) { return now - signal.timestamp > timeout; }),
                      signals.end());
        removed += before - signals.size();

        if (signals.empty()) {
            it = state.typingByChannel.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace Actions

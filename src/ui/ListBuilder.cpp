#include "ui/ListBuilder.h"

#include <algorithm>
#include <unordered_set>

#include "utils/Time.h"

namespace ListBuilder {

namespace {

RenderItem makeDateSeparator(const Message &message) {
    RenderItem item;
    item.type = RenderItemType::DATE_SEPARATOR;
    item.id = std::string(RenderItemIds::DATE_PREFIX) + TimeUtils::localDayKey(message.createAt);
    item.date = message.createAt;
    item.showHeader = false;
    return item;
}

RenderItem makeLoader(RenderItemType type, LoadDirection direction) {
    RenderItem item;
    item.type = type;
    item.direction = direction;
    item.showHeader = false;
    if (type == RenderItemType::LOADING) {
        item.id = direction == LoadDirection::OLDER ? RenderItemIds::LOADING_OLDER : RenderItemIds::LOADING_NEWER;
    } else {
        item.id = direction == LoadDirection::OLDER ? RenderItemIds::LOAD_OLDER : RenderItemIds::LOAD_NEWER;
    }
    return item;
}

RenderItem makeStartOfConversation() {
    RenderItem item;
    item.type = RenderItemType::START_OF_CONVERSATION;
    item.id = RenderItemIds::START_OF_CONVERSATION;
    item.showHeader = false;
    return item;
}

bool continuesGroup(const Message &previous, const Message &current, std::chrono::milliseconds window) {
    if (previous.isSystemMessage() || current.isSystemMessage()) {
        return false;
    }
    if (previous.authorId != current.authorId) {
        return false;
    }
    auto elapsed = current.createAt - previous.createAt;
    return elapsed >= decltype(elapsed)::zero() && elapsed < window;
}

} // namespace

bool isHiddenJoinLeave(const Message &message, const BuildOptions &options) {
    if (options.showJoinLeave || !message.isJoinLeaveMessage()) {
        return false;
    }
    return !message.referencesUser(options.viewer.id, options.viewer.username);
}

std::vector<RenderItem> build(const std::vector<std::string> &orderedIds, const MessageMap &messagesById,
                              const BuildOptions &options) {
    std::vector<MessagePtr> ordered;
    ordered.reserve(orderedIds.size());

    std::unordered_set<std::string> seen;
    for (auto it = orderedIds.rbegin(); it != orderedIds.rend(); ++it) {
        auto found = messagesById.find(*it);
        if (found == messagesById.end() || !found->second) {
            continue;
        }
        if (!seen.insert(*it).second) {
            continue;
        }
        if (isHiddenJoinLeave(*found->second, options)) {
            continue;
        }
        ordered.push_back(found->second);
    }

    std::vector<RenderItem> result;
    result.reserve(ordered.size() + ordered.size() / 8 + 1);

    const Message *previous = nullptr;
    for (const auto &message : ordered) {
        bool needsSeparator = !previous || !TimeUtils::isSameLocalDay(previous->createAt, message->createAt);
        if (needsSeparator) {
            result.push_back(makeDateSeparator(*message));
        }

        RenderItem item;
        item.type = RenderItemType::MESSAGE;
        item.id = message->id;
        item.message = message;
        item.grouped = !needsSeparator && previous && continuesGroup(*previous, *message, options.groupingWindow);
        item.showHeader = !item.grouped && options.channelType != ChannelType::DIRECT;
        item.isOwnMessage = !options.viewer.id.empty() && message->authorId == options.viewer.id;
        result.push_back(std::move(item));

        previous = message.get();
    }

    return result;
}

std::vector<RenderItem> injectLoaders(std::vector<RenderItem> items, bool atOldestBoundary, bool atNewestBoundary,
                                      LoadingState loading) {
    if (items.empty()) {
        if (atOldestBoundary && atNewestBoundary) {
            items.push_back(makeStartOfConversation());
        } else if (loading != LoadingState::NONE) {
            items.push_back(makeLoader(RenderItemType::LOADING, LoadDirection::OLDER));
        }
        return items;
    }

    if (atOldestBoundary) {
        items.insert(items.begin(), makeStartOfConversation());
    } else if (loading == LoadingState::OLDER || loading == LoadingState::INITIAL) {
        items.insert(items.begin(), makeLoader(RenderItemType::LOADING, LoadDirection::OLDER));
    } else {
        items.insert(items.begin(), makeLoader(RenderItemType::LOAD_MORE, LoadDirection::OLDER));
    }

    if (!atNewestBoundary) {
        items.push_back(makeLoader(loading == LoadingState::NEWER ? RenderItemType::LOADING : RenderItemType::LOAD_MORE,
                                   LoadDirection::NEWER));
    }

    return items;
}

std::vector<RenderItem> injectUnreadSeparator(std::vector<RenderItem> items,
                                              std::chrono::system_clock::time_point lastViewedAt, int unreadCount,
                                              ChannelType channelType) {
    if (unreadCount <= 0) {
        return items;
    }

    auto firstUnread = std::find_if(items.begin(), items.end(), [lastViewedAt](const RenderItem &item) {
        return item.type == RenderItemType::MESSAGE && item.message && item.message->createAt > lastViewedAt;
    });
    if (firstUnread == items.end()) {
        return items;
    }

    RenderItem separator;
    separator.type = RenderItemType::UNREAD_SEPARATOR;
    separator.id = std::string(RenderItemIds::UNREAD_PREFIX) + std::to_string(TimeUtils::toUnixMs(lastViewedAt));
    separator.unreadCount = unreadCount;
    separator.showHeader = false;

    firstUnread->grouped = false;
    firstUnread->showHeader = channelType != ChannelType::DIRECT;

    items.insert(firstUnread, std::move(separator));
    return items;
}

std::vector<RenderItem> buildFeed(const FeedInputs &inputs, std::chrono::milliseconds groupingWindow) {
    BuildOptions options;
    options.viewer = inputs.viewer;
    options.channelType = inputs.channelType;
    options.showJoinLeave = inputs.showJoinLeave;
    options.groupingWindow = groupingWindow;

    auto items = build(inputs.order, inputs.messages, options);
    items = injectLoaders(std::move(items), inputs.atOldestBoundary, inputs.atNewestBoundary, inputs.loading);
    return injectUnreadSeparator(std::move(items), inputs.lastViewedAt, inputs.unreadCount, inputs.channelType);
}

std::optional<size_t> findUnreadSeparator(const std::vector<RenderItem> &items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].type == RenderItemType::UNREAD_SEPARATOR) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace ListBuilder

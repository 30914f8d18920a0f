#include "state/RealtimeMerger.h"

#include "state/Actions.h"
#include "state/Selectors.h"
#include "utils/Logger.h"

namespace {

bool countsAsUnread(const AppState &state, const Message &message) {
    if (message.isReply() || message.pending) {
        return false;
    }
    if (!state.viewer.id.empty() && message.authorId == state.viewer.id) {
        return false;
    }
    auto it = state.channelPosts.find(message.channelId);
    return it == state.channelPosts.end() || message.createAt > it->second.lastViewedAt;
}

} // namespace

RealtimeMerger::RealtimeMerger(Store &store, std::chrono::milliseconds typingTimeout)
    : m_store(store), m_typingTimeout(typingTimeout) {}

bool RealtimeMerger::handle(const Feed::PushEvent &event, std::chrono::steady_clock::time_point now) {
    switch (event.kind) {
    case Feed::PushEvent::Kind::TYPING:
        return handleTyping(event, now);
    case Feed::PushEvent::Kind::MESSAGE_CREATED:
        return event.message && handleCreated(*event.message);
    case Feed::PushEvent::Kind::MESSAGE_UPDATED:
        return event.message && handleUpdated(*event.message);
    case Feed::PushEvent::Kind::MESSAGE_DELETED:
        return handleDeleted(event);
    case Feed::PushEvent::Kind::REACTION_ADDED:
    case Feed::PushEvent::Kind::REACTION_REMOVED:
        return handleReaction(event);
    }
    return false;
}

bool RealtimeMerger::handleJson(const nlohmann::json &envelope, std::chrono::steady_clock::time_point now) {
    auto event = Feed::PushEvent::fromJson(envelope);
    if (!event) {
        return false;
    }
    return handle(*event, now);
}

size_t RealtimeMerger::sweep(std::chrono::steady_clock::time_point now) {
    size_t removed = 0;
    m_store.update([&](AppState &state) { removed = Actions::sweepTyping(state, now, m_typingTimeout); });
    if (removed > 0) {
        Logger::debug("Expired " + std::to_string(removed) + " typing signal(s)");
    }
    return removed;
}

bool RealtimeMerger::handleTyping(const Feed::PushEvent &event, std::chrono::steady_clock::time_point now) {
    if (event.userId.empty() || event.channelId.empty()) {
        Logger::debug("Dropping typing event without user or channel");
        return false;
    }

    bool applied = false;
    m_store.update([&](AppState &state) {
        if (event.userId == state.viewer.id) {
            return;
        }

        TypingSignal signal;
        signal.channelId = event.channelId;
        signal.userId = event.userId;
        signal.displayName = Selectors::resolveDisplayName(state, event.userId, event.username);
        signal.timestamp = now;
        Actions::upsertTyping(state, signal);
        applied = true;
    });
    return applied;
}

bool RealtimeMerger::handleCreated(const Message &message) {
    bool applied = false;
    m_store.update([&](AppState &state) {
        const bool known = state.messages.count(message.id) > 0;
        const bool unread = !known && countsAsUnread(state, message);

        applied = Actions::upsertMessage(state, message) || !known;
        Actions::removeTyping(state, message.channelId, message.authorId);

        if (unread) {
            state.channelPosts[message.channelId].unreadCount += 1;
        }
    });
    return applied;
}

bool RealtimeMerger::handleUpdated(const Message &message) {
    bool applied = false;
    m_store.update([&](AppState &state) {
        auto it = state.messages.find(message.id);
        if (it == state.messages.end()) {
            Logger::debug("Edit for unknown message " + message.id + " stored without placement");
            state.messages[message.id] = std::make_shared<const Message>(message);
            applied = true;
            return;
        }
        it->second = std::make_shared<const Message>(message);
        applied = true;
    });
    return applied;
}

bool RealtimeMerger::handleDeleted(const Feed::PushEvent &event) {
    std::string messageId;
    if (event.message) {
        messageId = event.message->id;
    }
    if (messageId.empty()) {
        Logger::debug("Dropping delete event without message id");
        return false;
    }

    bool applied = false;
    m_store.update([&](AppState &state) {
        MessagePtr removed = Actions::removeMessage(state, messageId);
        if (!removed) {
            return;
        }
        applied = true;

        if (countsAsUnread(state, *removed)) {
            auto &posts = state.channelPosts[removed->channelId];
            if (posts.unreadCount > 0) {
                posts.unreadCount -= 1;
            }
        }
    });
    return applied;
}

bool RealtimeMerger::handleReaction(const Feed::PushEvent &event) {
    if (!event.reaction) {
        return false;
    }

    bool applied = false;
    m_store.update([&](AppState &state) {
        if (event.kind == Feed::PushEvent::Kind::REACTION_ADDED) {
            applied = Actions::addReaction(state, *event.reaction);
        } else {
            applied = Actions::removeReaction(state, *event.reaction);
        }
    });
    return applied;
}

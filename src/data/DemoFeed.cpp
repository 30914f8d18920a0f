#include "data/DemoFeed.h"

#include <algorithm>
#include <chrono>
#include <iterator>

#include "state/Actions.h"
#include "utils/Logger.h"
#include "utils/Time.h"

namespace Data {

namespace {

const char *kLiveLines[] = {
    "Just saw the alert, looking now.",
    "False alarm, the disk filled up with old traces.",
    "Can we move the sync to 3pm?",
    "Works for me.",
    "Posting the numbers in a minute.\nThroughput is up about 12%\nand p99 latency is flat.",
};

const char *kLiveEmoji[] = {"thumbsup", "white_check_mark", "rocket"};

const char *kViewerLines[] = {
    "On it.",
    "I'll take the follow-up ticket.",
    "Thanks, that fixed it for me too.",
};

// Every third local send fails.
constexpr uint64_t kFailEverySend = 3;

int64_t nowMs() { return TimeUtils::toUnixMs(std::chrono::system_clock::now()); }

} // namespace

DemoFeed::DemoFeed(FixtureConversation &conversation, Store &store, RealtimeMerger &merger, double intervalSeconds)
    : m_conversation(conversation), m_store(store), m_merger(merger), m_intervalSeconds(intervalSeconds) {}

DemoFeed::~DemoFeed() { stop(); }

void DemoFeed::start() {
    if (m_running) {
        return;
    }
    bool hasPeer = std::any_of(m_conversation.users.begin(), m_conversation.users.end(),
                               [this](const User &user) { return user.id != m_conversation.viewer.id; });
    if (!hasPeer) {
        Logger::warn("Demo feed needs at least one user besides the viewer, not starting");
        return;
    }
    m_running = true;
    Fl::add_timeout(m_intervalSeconds, timerCallback, this);
}

void DemoFeed::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    Fl::remove_timeout(timerCallback, this);
}

const User &DemoFeed::randomPeer() {
    std::vector<const User *> peers;
    for (const auto &user : m_conversation.users) {
        if (user.id != m_conversation.viewer.id) {
            peers.push_back(&user);
        }
    }
    std::uniform_int_distribution<size_t> pick(0, peers.size() - 1);
    return *peers[pick(m_rng)];
}

nlohmann::json DemoFeed::typingEnvelope(const std::string &userId) {
    return {{"event", "typing"},
            {"data", {{"user_id", userId}, {"parent_id", ""}}},
            {"broadcast", {{"channel_id", m_conversation.channel.id}}}};
}

nlohmann::json DemoFeed::postedEnvelope(const std::string &userId) {
    std::uniform_int_distribution<size_t> pickLine(0, std::size(kLiveLines) - 1);
    const std::string id = "live-" + std::to_string(m_nextPostNumber++);
    nlohmann::json post =
        FixtureConversation::makePost(id, m_conversation.channel.id, userId, kLiveLines[pickLine(m_rng)], nowMs());
    m_conversation.posts.push_back(post);

    return {{"event", "posted"},
            {"data", {{"post", post.dump()}, {"sender_name", "@" + userId}}},
            {"broadcast", {{"channel_id", m_conversation.channel.id}}}};
}

std::string DemoFeed::sendLocal(const std::string &text) {
    if (m_outstandingSend) {
        completeLocalSend(false);
    }

    Message message;
    message.id = Actions::generatePendingId();
    message.channelId = m_conversation.channel.id;
    message.authorId = m_conversation.viewer.id;
    message.content = text;
    message.createAt = std::chrono::system_clock::now();

    m_store.update([&](AppState &state) { Actions::addPendingMessage(state, message); });
    m_outstandingSend = message;
    ++m_localSends;
    return message.id;
}

bool DemoFeed::completeLocalSend(bool delivered) {
    if (!m_outstandingSend) {
        return false;
    }
    Message sent = std::move(*m_outstandingSend);
    m_outstandingSend.reset();

    if (!delivered) {
        bool marked = false;
        m_store.update([&](AppState &state) { marked = Actions::markMessageFailed(state, sent.id); });
        Logger::warn("Local send " + sent.id + " failed");
        return marked;
    }

    const std::string id = "live-" + std::to_string(m_nextPostNumber++);
    nlohmann::json post = FixtureConversation::makePost(id, sent.channelId, sent.authorId, sent.content,
                                                        TimeUtils::toUnixMs(sent.createAt));
    post["pending_post_id"] = sent.id;
    m_conversation.posts.push_back(post);

    emit({{"event", "posted"},
          {"data", {{"post", post.dump()}}},
          {"broadcast", {{"channel_id", sent.channelId}}}});
    return true;
}

void DemoFeed::emit(const nlohmann::json &envelope) {
    if (!m_merger.handleJson(envelope)) {
        Logger::debug("Demo event had no effect: " + envelope.value("event", std::string("?")));
    }
}

void DemoFeed::tick() {
    const std::string &channelId = m_conversation.channel.id;

    switch (m_step % 10) {
    case 0:
        m_pendingAuthor = randomPeer().id;
        emit(typingEnvelope(m_pendingAuthor));
        break;
    case 1:
        emit(typingEnvelope(m_pendingAuthor));
        emit(typingEnvelope(randomPeer().id));
        break;
    case 2:
        emit(postedEnvelope(m_pendingAuthor));
        break;
    case 3: {
        if (m_conversation.posts.empty()) {
            break;
        }
        std::uniform_int_distribution<size_t> pickEmoji(0, std::size(kLiveEmoji) - 1);
        nlohmann::json reaction = {{"user_id", randomPeer().id},
                                   {"post_id", m_conversation.posts.back().value("id", std::string())},
                                   {"emoji_name", kLiveEmoji[pickEmoji(m_rng)]},
                                   {"create_at", nowMs()}};
        emit({{"event", "reaction_added"},
              {"data", {{"reaction", reaction.dump()}}},
              {"broadcast", {{"channel_id", channelId}}}});
        break;
    }
    case 4:
        emit(typingEnvelope(m_conversation.viewer.id));
        break;
    case 5: {
        if (m_conversation.posts.size() < 2) {
            break;
        }
        auto &post = m_conversation.posts[m_conversation.posts.size() - 2];
        post["message"] = post.value("message", std::string()) + " (follow-up: resolved)";
        post["edit_at"] = nowMs();
        emit({{"event", "post_edited"}, {"data", {{"post", post.dump()}}}, {"broadcast", {{"channel_id", channelId}}}});
        break;
    }
    case 6:
        emit({{"event", "typing"}, {"data", nlohmann::json::object()}, {"broadcast", nlohmann::json::object()}});
        break;
    case 7: {
        if ((m_step / 10) % 2 != 0 || m_nextPostNumber <= 2) {
            break;
        }
        const std::string id = "live-" + std::to_string(m_nextPostNumber - 2);
        auto index = m_conversation.indexOf(id);
        if (!index) {
            break;
        }
        nlohmann::json post = m_conversation.posts[*index];
        post["delete_at"] = nowMs();
        m_conversation.posts.erase(m_conversation.posts.begin() + static_cast<std::ptrdiff_t>(*index));
        emit({{"event", "post_deleted"}, {"data", {{"post", post.dump()}}}, {"broadcast", {{"channel_id", channelId}}}});
        break;
    }
    case 8:
        sendLocal(kViewerLines[m_localSends % std::size(kViewerLines)]);
        break;
    case 9:
        completeLocalSend(m_localSends % kFailEverySend != 0);
        break;
    }

    ++m_step;
    if (m_running) {
        Fl::repeat_timeout(m_intervalSeconds, timerCallback, this);
    }
}

void DemoFeed::timerCallback(void *data) {
    auto *feed = static_cast<DemoFeed *>(data);
    feed->tick();
}

} // namespace Data

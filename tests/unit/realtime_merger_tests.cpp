#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "TestSupport.h"
#include "state/Actions.h"
#include "state/RealtimeMerger.h"
#include "state/Selectors.h"
#include "state/Store.h"

using namespace std::chrono_literals;
using Feed::PushEvent;

namespace {

constexpr std::chrono::milliseconds kTypingTimeout = 5000ms;

const std::chrono::steady_clock::time_point kT0 = std::chrono::steady_clock::time_point{} + 1h;

void seedChannel(Store &store, bool atNewest = true) {
    store.update([atNewest](AppState &state) {
        state.viewer.id = "me";
        state.viewer.username = "me";
        Actions::setActiveChannel(state, "c1");
        TestSupport::storeMessages(state, "c1",
                                   {TestSupport::makeMessage("m2", "ann", 1), TestSupport::makeMessage("m1", "bo", 0)});
        auto &posts = state.channelPosts["c1"];
        posts.atNewestBoundary = atNewest;
        posts.lastViewedAt = TestSupport::at(1);
    });
}

PushEvent typing(const std::string &userId, const std::string &username = "", const std::string &channelId = "c1") {
    PushEvent event;
    event.kind = PushEvent::Kind::TYPING;
    event.channelId = channelId;
    event.userId = userId;
    event.username = username;
    return event;
}

PushEvent created(const Message &message) {
    PushEvent event;
    event.kind = PushEvent::Kind::MESSAGE_CREATED;
    event.channelId = message.channelId;
    event.userId = message.authorId;
    event.message = message;
    return event;
}

PushEvent withKind(PushEvent event, PushEvent::Kind kind) {
    event.kind = kind;
    return event;
}

std::vector<TypingSignal> typersAt(const Store &store, std::chrono::steady_clock::time_point now) {
    return Selectors::activeTypers(store.snapshot(), "c1", now, kTypingTimeout);
}

} // namespace

TEST(RealtimeMerger, TypingSignalExpiresAfterTimeout) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_TRUE(merger.handle(typing("ann", "Ann"), kT0));

    EXPECT_EQ(typersAt(store, kT0 + kTypingTimeout - 1ms).size(), 1u);
    EXPECT_TRUE(typersAt(store, kT0 + kTypingTimeout + 1ms).empty());

    EXPECT_EQ(merger.sweep(kT0 + kTypingTimeout - 1ms), 0u);
    EXPECT_EQ(merger.sweep(kT0 + kTypingTimeout + 1ms), 1u);
    EXPECT_EQ(store.snapshot().typingByChannel.count("c1"), 0u);
}

TEST(RealtimeMerger, RepeatedTypingRefreshesSingleEntry) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    merger.handle(typing("ann", "Ann"), kT0);
    merger.handle(typing("ann", "Ann"), kT0 + 4s);

    auto signals = store.snapshot().typingByChannel["c1"];
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].timestamp, kT0 + 4s);
    EXPECT_EQ(typersAt(store, kT0 + 8s).size(), 1u);
}

TEST(RealtimeMerger, ViewerOwnTypingIsDiscarded) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_FALSE(merger.handle(typing("me", "me"), kT0));
    EXPECT_TRUE(store.snapshot().typingByChannel.empty());
}

TEST(RealtimeMerger, TypingWithoutUserIsDropped) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_FALSE(merger.handle(typing(""), kT0));
    EXPECT_FALSE(merger.handle(typing("ann", "Ann", ""), kT0));
    EXPECT_TRUE(store.snapshot().typingByChannel.empty());
}

TEST(RealtimeMerger, TypingNameResolution) {
    Store store;
    seedChannel(store);
    store.update([](AppState &state) {
        User user;
        user.id = "ann";
        user.username = "ann";
        user.firstName = "Ann";
        user.lastName = "Lee";
        state.users[user.id] = user;
    });
    RealtimeMerger merger(store, kTypingTimeout);

    merger.handle(typing("ann", "payload-ann"), kT0);
    merger.handle(typing("bo", "Bo"), kT0);
    merger.handle(typing("cy"), kT0);

    auto signals = typersAt(store, kT0);
    ASSERT_EQ(signals.size(), 3u);
    EXPECT_EQ(signals[0].displayName, "Ann Lee");
    EXPECT_EQ(signals[1].displayName, "Bo");
    EXPECT_EQ(signals[2].displayName, Selectors::UNKNOWN_USER_NAME);
}

TEST(RealtimeMerger, NewMessageEntersHeadAtNewestBoundary) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_TRUE(merger.handle(created(TestSupport::makeMessage("m3", "ann", 2)), kT0));

    auto state = store.snapshot();
    EXPECT_EQ(state.channelPosts["c1"].order, (std::vector<std::string>{"m3", "m2", "m1"}));
    EXPECT_EQ(state.channelPosts["c1"].unreadCount, 1);
}

TEST(RealtimeMerger, NewMessageAwayFromNewestIsStoredButNotPlaced) {
    Store store;
    seedChannel(store, false);
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_TRUE(merger.handle(created(TestSupport::makeMessage("m3", "ann", 2)), kT0));

    auto state = store.snapshot();
    EXPECT_EQ(state.channelPosts["c1"].order, (std::vector<std::string>{"m2", "m1"}));
    EXPECT_EQ(state.messages.count("m3"), 1u);
    EXPECT_EQ(state.channelPosts["c1"].unreadCount, 1);
}

TEST(RealtimeMerger, KnownMessageIsNotCountedTwice) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    Message message = TestSupport::makeMessage("m3", "ann", 2);
    merger.handle(created(message), kT0);
    EXPECT_FALSE(merger.handle(created(message), kT0));

    auto state = store.snapshot();
    EXPECT_EQ(state.channelPosts["c1"].unreadCount, 1);
    EXPECT_EQ(state.channelPosts["c1"].order.size(), 3u);
}

TEST(RealtimeMerger, RepliesOwnAndReadMessagesDoNotCountAsUnread) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    Message reply = TestSupport::makeMessage("r1", "ann", 2);
    reply.rootId = "m1";
    Message own = TestSupport::makeMessage("m3", "me", 3);
    Message alreadyRead = TestSupport::makeMessage("m4", "bo", 0);

    merger.handle(created(reply), kT0);
    merger.handle(created(own), kT0);
    merger.handle(created(alreadyRead), kT0);

    auto state = store.snapshot();
    EXPECT_EQ(state.channelPosts["c1"].unreadCount, 0);
    EXPECT_EQ(state.messages.count("r1"), 1u);
    EXPECT_EQ(state.channelPosts["c1"].order, (std::vector<std::string>{"m4", "m3", "m2", "m1"}));
}

TEST(RealtimeMerger, PostClearsAuthorTypingSignal) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    merger.handle(typing("ann", "Ann"), kT0);
    merger.handle(typing("bo", "Bo"), kT0);
    merger.handle(created(TestSupport::makeMessage("m3", "ann", 2)), kT0 + 1s);

    auto signals = typersAt(store, kT0 + 1s);
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].userId, "bo");
}

TEST(RealtimeMerger, EditReplacesRecordAndKeepsOrder) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    Message edited = TestSupport::makeMessage("m1", "bo", 0, "c1", "edited");
    edited.editAt = TestSupport::at(5);
    EXPECT_TRUE(merger.handle(withKind(created(edited), PushEvent::Kind::MESSAGE_UPDATED), kT0));

    auto state = store.snapshot();
    EXPECT_EQ(state.messages["m1"]->content, "edited");
    EXPECT_TRUE(state.messages["m1"]->wasEdited());
    EXPECT_EQ(state.channelPosts["c1"].order, (std::vector<std::string>{"m2", "m1"}));
}

TEST(RealtimeMerger, EditOfUnknownMessageIsNotPlaced) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    Message edited = TestSupport::makeMessage("m9", "bo", 3);
    merger.handle(withKind(created(edited), PushEvent::Kind::MESSAGE_UPDATED), kT0);

    auto state = store.snapshot();
    EXPECT_EQ(state.messages.count("m9"), 1u);
    EXPECT_EQ(state.channelPosts["c1"].order.size(), 2u);
    EXPECT_EQ(state.channelPosts["c1"].unreadCount, 0);
}

TEST(RealtimeMerger, DeleteRemovesMessageAndUnreadCount) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    Message message = TestSupport::makeMessage("m3", "ann", 2);
    merger.handle(created(message), kT0);
    EXPECT_TRUE(merger.handle(withKind(created(message), PushEvent::Kind::MESSAGE_DELETED), kT0));

    auto state = store.snapshot();
    EXPECT_EQ(state.messages.count("m3"), 0u);
    EXPECT_EQ(state.channelPosts["c1"].order, (std::vector<std::string>{"m2", "m1"}));
    EXPECT_EQ(state.channelPosts["c1"].unreadCount, 0);

    EXPECT_FALSE(merger.handle(withKind(created(message), PushEvent::Kind::MESSAGE_DELETED), kT0));
}

TEST(RealtimeMerger, UnreadCountNeverGoesNegative) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    Message message = TestSupport::makeMessage("m3", "ann", 2);
    merger.handle(created(message), kT0);
    store.update([](AppState &state) { state.channelPosts["c1"].unreadCount = 0; });

    merger.handle(withKind(created(message), PushEvent::Kind::MESSAGE_DELETED), kT0);
    EXPECT_EQ(store.snapshot().channelPosts["c1"].unreadCount, 0);
}

TEST(RealtimeMerger, ReactionsAddAndRemove) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    PushEvent event;
    event.kind = PushEvent::Kind::REACTION_ADDED;
    event.channelId = "c1";
    event.userId = "bo";
    event.reaction = Reaction{};
    event.reaction->userId = "bo";
    event.reaction->postId = "m2";
    event.reaction->emojiName = "tada";

    EXPECT_TRUE(merger.handle(event, kT0));
    EXPECT_FALSE(merger.handle(event, kT0));
    EXPECT_EQ(store.snapshot().messages["m2"]->reactions.size(), 1u);

    EXPECT_TRUE(merger.handle(withKind(event, PushEvent::Kind::REACTION_REMOVED), kT0));
    EXPECT_TRUE(store.snapshot().messages["m2"]->reactions.empty());

    event.reaction->postId = "unknown";
    EXPECT_FALSE(merger.handle(event, kT0));
}

TEST(RealtimeMerger, MalformedEnvelopesAreDropped) {
    Store store;
    seedChannel(store);
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_FALSE(merger.handleJson(nlohmann::json::array(), kT0));
    EXPECT_FALSE(merger.handleJson({{"event", "typing"}, {"data", {{"user_id", 7}}}}, kT0));
    EXPECT_FALSE(merger.handleJson({{"event", "posted"}, {"data", {{"post", "{not json"}}}}, kT0));
    EXPECT_FALSE(merger.handleJson({{"event", "channel_viewed"}}, kT0));

    EXPECT_TRUE(merger.handleJson({{"event", "typing"},
                                   {"data", {{"user_id", "ann"}}},
                                   {"broadcast", {{"channel_id", "c1"}}}},
                                  kT0));
    EXPECT_EQ(typersAt(store, kT0).size(), 1u);
}

TEST(RealtimeMerger, SweepIntervalIsHalfTheTimeout) {
    Store store;
    RealtimeMerger merger(store, kTypingTimeout);

    EXPECT_EQ(merger.typingTimeout(), kTypingTimeout);
    EXPECT_EQ(merger.sweepInterval(), 2500ms);
}

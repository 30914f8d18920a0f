#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "net/PostsSource.h"
#include "net/PushEvent.h"

using Feed::FetchDirection;
using Feed::FetchResult;
using Feed::PushEvent;
using json = nlohmann::json;

namespace {

json post(const std::string &id, int64_t createAt, const std::string &channelId = "c1") {
    return {{"id", id}, {"channel_id", channelId}, {"user_id", "ann"}, {"message", "hi " + id}, {"create_at", createAt}};
}

} // namespace

TEST(PushEvent, PostedWithEncodedPost) {
    json envelope = {{"event", "posted"},
                     {"data", {{"post", post("m1", 1000).dump()}, {"sender_name", "@ann"}}},
                     {"broadcast", {{"channel_id", "c1"}}}};

    auto event = PushEvent::fromJson(envelope);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, PushEvent::Kind::MESSAGE_CREATED);
    EXPECT_EQ(event->channelId, "c1");
    EXPECT_EQ(event->userId, "ann");
    EXPECT_EQ(event->username, "@ann");
    ASSERT_TRUE(event->message.has_value());
    EXPECT_EQ(event->message->id, "m1");
    EXPECT_EQ(event->message->content, "hi m1");
}

TEST(PushEvent, MessageEventAliases) {
    json updated = {{"event", "message-updated"}, {"data", {{"post", post("m1", 1000)}}}};
    json deleted = {{"event", "post_deleted"}, {"data", {{"post", post("m1", 1000)}}}};

    auto edit = PushEvent::fromJson(updated);
    auto removal = PushEvent::fromJson(deleted);
    ASSERT_TRUE(edit && removal);
    EXPECT_EQ(edit->kind, PushEvent::Kind::MESSAGE_UPDATED);
    EXPECT_EQ(removal->kind, PushEvent::Kind::MESSAGE_DELETED);
    EXPECT_EQ(edit->channelId, "c1");
}

TEST(PushEvent, MessageWithoutIdIsDropped) {
    json payload = post("", 1000);
    EXPECT_FALSE(PushEvent::fromJson({{"event", "posted"}, {"data", {{"post", payload}}}}).has_value());
    EXPECT_FALSE(PushEvent::fromJson({{"event", "posted"}, {"data", json::object()}}).has_value());
}

TEST(PushEvent, EmptyChannelFallsBackToBroadcast) {
    json envelope = {{"event", "posted"},
                     {"data", {{"post", post("m1", 1000, "")}}},
                     {"broadcast", {{"channel_id", "c9"}}}};

    auto event = PushEvent::fromJson(envelope);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->message->channelId, "c9");

    envelope.erase("broadcast");
    EXPECT_FALSE(PushEvent::fromJson(envelope).has_value());
}

TEST(PushEvent, Typing) {
    json envelope = {{"event", "typing"},
                     {"data", {{"user_id", "bo"}, {"username", "Bo"}}},
                     {"broadcast", {{"channel_id", "c1"}}}};

    auto event = PushEvent::fromJson(envelope);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, PushEvent::Kind::TYPING);
    EXPECT_EQ(event->userId, "bo");
    EXPECT_EQ(event->username, "Bo");
    EXPECT_EQ(event->channelId, "c1");
    EXPECT_FALSE(event->message.has_value());
}

TEST(PushEvent, TypingWithoutChannelIsDropped) {
    EXPECT_FALSE(PushEvent::fromJson({{"event", "typing"}, {"data", {{"user_id", "bo"}}}}).has_value());

    auto fromData = PushEvent::fromJson({{"event", "typing"}, {"data", {{"user_id", "bo"}, {"channel_id", "c2"}}}});
    ASSERT_TRUE(fromData.has_value());
    EXPECT_EQ(fromData->channelId, "c2");
}

TEST(PushEvent, Reactions) {
    json reaction = {{"user_id", "bo"}, {"post_id", "m1"}, {"emoji_name", "tada"}, {"create_at", 2000}};
    json added = {{"event", "reaction_added"}, {"data", {{"reaction", reaction.dump()}}},
                  {"broadcast", {{"channel_id", "c1"}}}};

    auto event = PushEvent::fromJson(added);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, PushEvent::Kind::REACTION_ADDED);
    ASSERT_TRUE(event->reaction.has_value());
    EXPECT_EQ(event->reaction->postId, "m1");
    EXPECT_EQ(event->reaction->emojiName, "tada");
    EXPECT_EQ(event->userId, "bo");

    reaction.erase("emoji_name");
    EXPECT_FALSE(PushEvent::fromJson({{"event", "reaction_removed"}, {"data", {{"reaction", reaction}}}}).has_value());
}

TEST(PushEvent, MalformedAndUnknownEnvelopes) {
    EXPECT_FALSE(PushEvent::fromJson(json::array()).has_value());
    EXPECT_FALSE(PushEvent::fromJson({{"event", "status_change"}}).has_value());
    EXPECT_FALSE(PushEvent::fromJson({{"data", json::object()}}).has_value());
    EXPECT_FALSE(PushEvent::fromJson({{"event", "posted"}, {"data", {{"post", "{\"id\":"}}}}).has_value());
    EXPECT_FALSE(PushEvent::fromJson({{"event", "posted"}, {"data", {{"post", {{"id", "m1"}}}}}}).has_value());
}

TEST(FetchResult, DecodesPageAndBoundaries) {
    json body = {{"order", {"m2", "m1", "ghost"}},
                 {"posts", {{"m1", post("m1", 1000)}, {"m2", post("m2", 2000)}}},
                 {"prev_post_id", ""},
                 {"next_post_id", "m3"}};

    auto result = FetchResult::fromJson(body, FetchDirection::INITIAL);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->messages.size(), 2u);
    EXPECT_EQ(result->messages[0].id, "m2");
    EXPECT_EQ(result->messages[1].id, "m1");
    EXPECT_EQ(result->atOldestBoundary, std::optional<bool>(true));
    EXPECT_EQ(result->atNewestBoundary, std::optional<bool>(false));
}

TEST(FetchResult, BoundariesOnlyInRequestedDirection) {
    json body = {{"order", json::array()}, {"posts", json::object()}, {"prev_post_id", ""}, {"next_post_id", ""}};

    auto older = FetchResult::fromJson(body, FetchDirection::OLDER);
    ASSERT_TRUE(older.has_value());
    EXPECT_EQ(older->atOldestBoundary, std::optional<bool>(true));
    EXPECT_FALSE(older->atNewestBoundary.has_value());

    auto newer = FetchResult::fromJson(body, FetchDirection::NEWER);
    ASSERT_TRUE(newer.has_value());
    EXPECT_FALSE(newer->atOldestBoundary.has_value());
    EXPECT_EQ(newer->atNewestBoundary, std::optional<bool>(true));
}

TEST(FetchResult, RejectsMalformedPayload) {
    EXPECT_FALSE(FetchResult::fromJson(json::object(), FetchDirection::INITIAL).has_value());
    EXPECT_FALSE(FetchResult::fromJson({{"order", "m1"}}, FetchDirection::INITIAL).has_value());

    json badPost = {{"order", {"m1"}}, {"posts", {{"m1", {{"id", "m1"}}}}}};
    EXPECT_FALSE(FetchResult::fromJson(badPost, FetchDirection::INITIAL).has_value());
}

#include "data/FixtureConversation.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <random>

#include "utils/Logger.h"
#include "utils/Time.h"

namespace Data {

namespace {

const char *kSampleLines[] = {
    "Morning! Did the nightly build pass?",
    "Yes, all green except the flaky socket test.",
    "I'll take a look at that one after standup.",
    "Pushed a fix for the scroll jump when older pages load.",
    "Can someone review the migration notes before Friday?\nThey touch the retention settings\nand the export job.",
    "Lunch?",
    "The new grouping window feels much better on long threads.",
    "Heads up: staging will be down for about twenty minutes while we rotate certificates.",
    "Thanks!",
    "Here is the log excerpt from the failing run, the interesting part is near the end where the worker "
    "restarts twice and the queue drains before the health check comes back.",
    "ok",
    "Shipping it.",
};

const char *kEmoji[] = {"thumbsup", "tada", "eyes", "heart"};

int64_t msFromMinutes(int minutes) { return static_cast<int64_t>(minutes) * 60 * 1000; }

std::string readStringField(const nlohmann::json &j, const char *key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace

nlohmann::json FixtureConversation::makePost(const std::string &id, const std::string &channelId,
                                             const std::string &userId, const std::string &text, int64_t createAtMs,
                                             const std::string &type) {
    nlohmann::json post = {{"id", id},
                           {"channel_id", channelId},
                           {"user_id", userId},
                           {"message", text},
                           {"create_at", createAtMs},
                           {"update_at", createAtMs},
                           {"edit_at", 0},
                           {"delete_at", 0},
                           {"root_id", ""},
                           {"type", type},
                           {"props", nlohmann::json::object()}};
    return post;
}

std::optional<FixtureConversation> FixtureConversation::loadFromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not open fixture " + path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;

        FixtureConversation conversation;
        conversation.channel = Channel::fromJson(j.at("channel"));
        if (j.contains("viewer") && j["viewer"].is_object()) {
            conversation.viewer.id = readStringField(j["viewer"], "id");
            conversation.viewer.username = readStringField(j["viewer"], "username");
        }
        if (j.contains("users") && j["users"].is_array()) {
            for (const auto &user : j["users"]) {
                conversation.users.push_back(User::fromJson(user));
            }
        }
        if (j.contains("posts") && j["posts"].is_array()) {
            for (const auto &post : j["posts"]) {
                conversation.posts.push_back(post);
            }
        }
        if (j.contains("last_viewed_at") && j["last_viewed_at"].is_number()) {
            conversation.lastViewedAtMs = j["last_viewed_at"].get<int64_t>();
        }

        std::stable_sort(conversation.posts.begin(), conversation.posts.end(),
                         [](const nlohmann::json &a, const nlohmann::json &b) {
                             return a.value("create_at", int64_t{0}) < b.value("create_at", int64_t{0});
                         });

        Logger::info("Loaded fixture with " + std::to_string(conversation.posts.size()) + " posts from " + path);
        return conversation;
    } catch (const std::exception &e) {
        Logger::error("Fixture " + path + " is malformed: " + e.what());
        return std::nullopt;
    }
}

FixtureConversation FixtureConversation::generate(const std::string &channelId, int postCount,
                                                  std::chrono::system_clock::time_point end, uint32_t seed) {
    FixtureConversation conversation;
    conversation.channel.id = channelId;
    conversation.channel.type = ChannelType::OPEN;
    conversation.channel.displayName = "town-square";

    const char *people[][4] = {{"u-ann", "ann", "Ann", "Lee"},
                               {"u-bo", "bo", "Bo", "Diaz"},
                               {"u-cy", "cy", "Cy", "Park"},
                               {"u-me", "me", "Sam", "Quinn"}};
    for (const auto &person : people) {
        User user;
        user.id = person[0];
        user.username = person[1];
        user.firstName = person[2];
        user.lastName = person[3];
        conversation.users.push_back(user);
    }
    conversation.viewer.id = "u-me";
    conversation.viewer.username = "me";

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> pickUser(0, 3);
    std::uniform_int_distribution<int> pickLine(0, static_cast<int>(std::size(kSampleLines)) - 1);
    std::uniform_int_distribution<int> percent(0, 99);
    std::uniform_int_distribution<int> burstGap(0, 3);
    std::uniform_int_distribution<int> longGap(6, 240);

    std::vector<int64_t> times(postCount > 0 ? postCount : 0);
    int64_t cursor = TimeUtils::toUnixMs(end);
    for (int i = postCount - 1; i >= 0; --i) {
        times[i] = cursor;
        cursor -= msFromMinutes(percent(rng) < 60 ? burstGap(rng) : longGap(rng)) + 1000;
    }

    int previousUser = 0;
    for (int i = 0; i < postCount; ++i) {
        int userIndex = percent(rng) < 55 ? previousUser : pickUser(rng);
        previousUser = userIndex;
        const std::string userId = people[userIndex][0];
        const std::string id = "p" + std::to_string(i + 1);

        nlohmann::json post;
        if (percent(rng) < 4) {
            post = makePost(id, channelId, userId, std::string(people[userIndex][1]) + " joined the channel.", times[i],
                            "system_join_channel");
            post["props"]["username"] = people[userIndex][1];
        } else {
            post = makePost(id, channelId, userId, kSampleLines[pickLine(rng)], times[i]);
            if (percent(rng) < 10) {
                post["reply_count"] = 1 + percent(rng) % 5;
            }
            if (percent(rng) < 12) {
                nlohmann::json reactions = nlohmann::json::array();
                reactions.push_back({{"user_id", people[pickUser(rng)][0]},
                                     {"post_id", id},
                                     {"emoji_name", kEmoji[percent(rng) % 4]},
                                     {"create_at", times[i] + 1000}});
                post["metadata"]["reactions"] = reactions;
            }
            if (percent(rng) < 6) {
                nlohmann::json files = nlohmann::json::array();
                files.push_back({{"id", "f" + std::to_string(i)},
                                 {"name", "report-" + std::to_string(i) + ".pdf"},
                                 {"extension", "pdf"},
                                 {"mime_type", "application/pdf"},
                                 {"size", 48000 + percent(rng) * 1000}});
                post["metadata"]["files"] = files;
            }
        }
        conversation.posts.push_back(std::move(post));
    }

    if (postCount > 6) {
        conversation.lastViewedAtMs = times[postCount - 7];
    }
    return conversation;
}

std::optional<size_t> FixtureConversation::indexOf(const std::string &postId) const {
    for (size_t i = 0; i < posts.size(); ++i) {
        if (readStringField(posts[i], "id") == postId) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<nlohmann::json> FixtureConversation::page(const Feed::FetchRequest &request) const {
    const size_t count = posts.size();
    const size_t perPage = request.perPage > 0 ? static_cast<size_t>(request.perPage) : 60;
    size_t begin = 0;
    size_t end = count;

    switch (request.direction) {
    case Feed::FetchDirection::INITIAL:
        begin = count > perPage ? count - perPage : 0;
        break;
    case Feed::FetchDirection::OLDER: {
        auto index = request.cursorId ? indexOf(*request.cursorId) : std::nullopt;
        if (!index) {
            return std::nullopt;
        }
        end = *index;
        begin = end > perPage ? end - perPage : 0;
        break;
    }
    case Feed::FetchDirection::NEWER: {
        auto index = request.cursorId ? indexOf(*request.cursorId) : std::nullopt;
        if (!index) {
            return std::nullopt;
        }
        begin = *index + 1;
        end = std::min(count, begin + perPage);
        break;
    }
    }

    nlohmann::json result = {{"order", nlohmann::json::array()}, {"posts", nlohmann::json::object()}};
    for (size_t i = end; i > begin; --i) {
        const auto &post = posts[i - 1];
        const std::string id = readStringField(post, "id");
        result["order"].push_back(id);
        result["posts"][id] = post;
    }
    result["prev_post_id"] = begin > 0 ? readStringField(posts[begin - 1], "id") : "";
    result["next_post_id"] = end < count ? readStringField(posts[end], "id") : "";
    return result;
}

int FixtureConversation::countUnread() const {
    int unread = 0;
    for (const auto &post : posts) {
        if (post.value("create_at", int64_t{0}) > lastViewedAtMs && readStringField(post, "user_id") != viewer.id &&
            readStringField(post, "root_id").empty()) {
            ++unread;
        }
    }
    return unread;
}

} // namespace Data

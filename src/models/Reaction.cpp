#include "models/Reaction.h"

#include "utils/Time.h"

Reaction Reaction::fromJson(const nlohmann::json &j) {
    Reaction reaction;

    if (j.contains("user_id") && j["user_id"].is_string()) {
        reaction.userId = j["user_id"].get<std::string>();
    }
    if (j.contains("post_id") && j["post_id"].is_string()) {
        reaction.postId = j["post_id"].get<std::string>();
    }
    if (j.contains("emoji_name") && j["emoji_name"].is_string()) {
        reaction.emojiName = j["emoji_name"].get<std::string>();
    }
    if (j.contains("create_at") && j["create_at"].is_number()) {
        reaction.createAt = TimeUtils::fromUnixMs(j["create_at"].get<int64_t>());
    }

    return reaction;
}

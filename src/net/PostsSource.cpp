#include "net/PostsSource.h"

#include "utils/Logger.h"

namespace Feed {

const char *toString(FetchDirection direction) {
    switch (direction) {
    case FetchDirection::INITIAL:
        return "initial";
    case FetchDirection::OLDER:
        return "older";
    case FetchDirection::NEWER:
        return "newer";
    default:
        return "initial";
    }
}

std::optional<FetchResult> FetchResult::fromJson(const nlohmann::json &j, FetchDirection direction) {
    if (!j.is_object() || !j.contains("order") || !j["order"].is_array()) {
        Logger::warn("FetchResult: payload has no order array");
        return std::nullopt;
    }

    FetchResult result;
    try {
        const nlohmann::json emptyPosts = nlohmann::json::object();
        const auto &posts = (j.contains("posts") && j["posts"].is_object()) ? j["posts"] : emptyPosts;

        for (const auto &idJson : j["order"]) {
            if (!idJson.is_string()) {
                continue;
            }
            const std::string id = idJson.get<std::string>();
            if (!posts.contains(id)) {
                Logger::debug("FetchResult: no post for id " + id);
                continue;
            }
            result.messages.push_back(Message::fromJson(posts[id]));
        }
    } catch (const nlohmann::json::exception &e) {
        Logger::error(std::string("FetchResult: malformed post: ") + e.what());
        return std::nullopt;
    }

    auto cursorEmpty = [&j](const char *key) -> std::optional<bool> {
        if (!j.contains(key)) {
            return std::nullopt;
        }
        const auto &value = j[key];
        if (value.is_null()) {
            return true;
        }
        if (value.is_string()) {
            return value.get<std::string>().empty();
        }
        return std::nullopt;
    };

    if (direction != FetchDirection::NEWER) {
        result.atOldestBoundary = cursorEmpty("prev_post_id");
    }
    if (direction != FetchDirection::OLDER) {
        result.atNewestBoundary = cursorEmpty("next_post_id");
    }

    return result;
}

} // namespace Feed

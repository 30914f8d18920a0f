#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/Channel.h"
#include "models/User.h"
#include "net/PostsSource.h"
#include "state/AppState.h"

namespace Data {

/**
 * @brief In-memory conversation that stands in for a server in the demo application
 *
 * Posts are kept oldest first in the server's JSON shape so pages can be served
 * exactly as a REST endpoint would return them.
 */
struct FixtureConversation {
    Channel channel;
    Viewer viewer;
    std::vector<User> users;
    std::vector<nlohmann::json> posts; ///< Oldest first
    int64_t lastViewedAtMs = 0;

    /**
     * @brief Read a conversation from {channel, viewer, users, posts, last_viewed_at}
     * @return The conversation, std::nullopt if the file is unreadable or malformed
     */
    static std::optional<FixtureConversation> loadFromFile(const std::string &path);

    /**
     * @brief Generate a conversation spread over several days, ending at `end`
     */
    static FixtureConversation generate(const std::string &channelId, int postCount,
                                        std::chrono::system_clock::time_point end, uint32_t seed = 7);

    static nlohmann::json makePost(const std::string &id, const std::string &channelId, const std::string &userId,
                                   const std::string &text, int64_t createAtMs, const std::string &type = "");

    std::optional<size_t> indexOf(const std::string &postId) const;

    /**
     * @brief Post list for a page request, shaped like {order, posts, prev_post_id, next_post_id}
     * @return std::nullopt if the cursor is unknown
     */
    std::optional<nlohmann::json> page(const Feed::FetchRequest &request) const;

    /**
     * @brief Messages newer than lastViewedAtMs authored by someone other than the viewer
     */
    int countUnread() const;
};

} // namespace Data

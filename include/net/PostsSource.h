#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/Message.h"

namespace Feed {

enum class FetchDirection { INITIAL, OLDER, NEWER };

const char *toString(FetchDirection direction);

/**
 * @brief One page request, tagged with the view generation active when it was sent
 */
struct FetchRequest {
    std::string channelId;
    FetchDirection direction = FetchDirection::INITIAL;
    std::optional<std::string> cursorId; ///< Oldest (OLDER) or newest (NEWER) known message ID
    int perPage = 60;
    uint64_t generation = 0;
};

/**
 * @brief One page of messages; boundary flags are set only when the server said so
 */
struct FetchResult {
    std::vector<Message> messages;  ///< Most recent first
    std::optional<bool> atOldestBoundary;
    std::optional<bool> atNewestBoundary;

    /**
     * @brief Decode a post list {order, posts, prev_post_id, next_post_id}
     * An empty prev_post_id means no older page; an empty next_post_id means no newer page.
     * IDs in order with no matching post are skipped.
     * @param j JSON object from the server
     * @param direction Direction the page was requested in
     * @return Decoded page, std::nullopt if the payload is malformed
     */
    static std::optional<FetchResult> fromJson(const nlohmann::json &j, FetchDirection direction);
};

struct FetchError {
    int code = 0; ///< HTTP status, 0 for transport-level failures
    std::string message;
};

/**
 * @brief Transport collaborator that delivers pages of a conversation
 *
 * Callbacks must run on the UI event loop. Retrying is the implementation's business.
 */
class PostsSource {
  public:
    using SuccessCallback = std::function<void(const FetchResult &)>;
    using ErrorCallback = std::function<void(const FetchError &)>;

    virtual ~PostsSource() = default;

    virtual void fetchPosts(const FetchRequest &request, SuccessCallback onSuccess, ErrorCallback onError) = 0;
};

} // namespace Feed

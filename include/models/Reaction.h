#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief Represents one user's emoji reaction on a message
 */
class Reaction {
  public:
    /**
     * @brief Deserialize reaction from JSON
     * @param j JSON object
     * @return Reaction instance
     */
    static Reaction fromJson(const nlohmann::json &j);

    bool operator==(const Reaction &other) const {
        return userId == other.userId && postId == other.postId && emojiName == other.emojiName;
    }

    std::string userId;
    std::string postId;
    std::string emojiName;
    std::chrono::system_clock::time_point createAt;
};

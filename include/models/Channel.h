#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief Conversation kinds, keyed by the server's one-letter type code
 */
enum class ChannelType {
    OPEN,    ///< "O", public channel
    PRIVATE, ///< "P", private channel
    DIRECT,  ///< "D", one-to-one direct message
    GROUP    ///< "G", group direct message
};

/**
 * @brief Parse a one-letter channel type code
 * @return Parsed type, std::nullopt for unknown codes
 */
std::optional<ChannelType> parseChannelType(const std::string &code);

/**
 * @brief Represents a conversation the feed can display
 */
class Channel {
  public:
    /**
     * @brief Deserialize channel from JSON
     * @param j JSON object from the server
     * @return Channel instance
     */
    static Channel fromJson(const nlohmann::json &j);

    /**
     * @brief Check if this is a one-to-one direct message
     */
    bool isDirect() const { return type == ChannelType::DIRECT; }

    std::string id;                         ///< Channel ID
    ChannelType type = ChannelType::OPEN;   ///< Channel type
    std::string displayName;                ///< Human-readable name
};

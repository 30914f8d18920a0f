#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief How teammates' names are rendered in typing notices and headers
 */
enum class NameDisplay { FullNameNickname, NicknameFullName, FullName, Username };

/**
 * @brief Parse a name display mode ("full_name_nickname", "nickname_full_name", "full_name", "username")
 * @return Parsed mode, std::nullopt for unknown values
 */
std::optional<NameDisplay> parseNameDisplay(const std::string &value);

/**
 * @brief Represents a cached user profile
 */
class User {
  public:
    /**
     * @brief Deserialize user from JSON
     * @param j JSON object from the server
     * @return User instance
     */
    static User fromJson(const nlohmann::json &j);

    /**
     * @brief Get "First Last", trimmed, or an empty string when neither part is set
     */
    std::string getFullName() const;

    /**
     * @brief Get the user's display name under the given mode
     * Falls back to the username when the preferred fields are empty.
     * @param mode Name display mode
     * @return Display name
     */
    std::string getDisplayName(NameDisplay mode) const;

    std::string id;        ///< User ID
    std::string username;  ///< Unique username
    std::string firstName; ///< Given name
    std::string lastName;  ///< Family name
    std::string nickname;  ///< Nickname chosen by the user
};

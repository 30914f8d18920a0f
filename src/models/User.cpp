#include "models/User.h"

std::optional<NameDisplay> parseNameDisplay(const std::string &value) {
    if (value == "full_name_nickname") {
        return NameDisplay::FullNameNickname;
    }
    if (value == "nickname_full_name") {
        return NameDisplay::NicknameFullName;
    }
    if (value == "full_name") {
        return NameDisplay::FullName;
    }
    if (value == "username") {
        return NameDisplay::Username;
    }
    return std::nullopt;
}

User User::fromJson(const nlohmann::json &j) {
    User user;

    user.id = j.at("id").get<std::string>();

    if (j.contains("username") && j["username"].is_string()) {
        user.username = j["username"].get<std::string>();
    }
    if (j.contains("first_name") && j["first_name"].is_string()) {
        user.firstName = j["first_name"].get<std::string>();
    }
    if (j.contains("last_name") && j["last_name"].is_string()) {
        user.lastName = j["last_name"].get<std::string>();
    }
    if (j.contains("nickname") && j["nickname"].is_string()) {
        user.nickname = j["nickname"].get<std::string>();
    }

    return user;
}

std::string User::getFullName() const {
    if (!firstName.empty() && !lastName.empty()) {
        return firstName + " " + lastName;
    }
    return firstName.empty() ? lastName : firstName;
}

std::string User::getDisplayName(NameDisplay mode) const {
    const std::string fullName = getFullName();
    std::string name;

    switch (mode) {
    case NameDisplay::FullNameNickname:
        name = !fullName.empty() ? fullName : nickname;
        break;
    case NameDisplay::NicknameFullName:
        name = !nickname.empty() ? nickname : fullName;
        break;
    case NameDisplay::FullName:
        name = fullName;
        break;
    case NameDisplay::Username:
        break;
    }

    return name.empty() ? username : name;
}

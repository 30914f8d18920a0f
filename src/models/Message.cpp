#include "models/Message.h"

#include <algorithm>
#include <unordered_map>

#include "utils/Time.h"

namespace {

std::string readString(const nlohmann::json &j, const char *key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

std::optional<std::chrono::system_clock::time_point> readTimestamp(const nlohmann::json &j, const char *key) {
    if (j.contains(key) && j[key].is_number()) {
        int64_t ms = j[key].get<int64_t>();
        if (ms > 0) {
            return TimeUtils::fromUnixMs(ms);
        }
    }
    return std::nullopt;
}

} // namespace

MessageType parseMessageType(const std::string &type) {
    static const std::unordered_map<std::string, MessageType> types = {
        {"system_join_leave", MessageType::JOIN_LEAVE},
        {"system_join_channel", MessageType::JOIN_CHANNEL},
        {"system_leave_channel", MessageType::LEAVE_CHANNEL},
        {"system_add_remove", MessageType::ADD_REMOVE},
        {"system_add_to_channel", MessageType::ADD_TO_CHANNEL},
        {"system_remove_from_channel", MessageType::REMOVE_FROM_CHANNEL},
        {"system_join_team", MessageType::JOIN_TEAM},
        {"system_leave_team", MessageType::LEAVE_TEAM},
        {"system_add_to_team", MessageType::ADD_TO_TEAM},
        {"system_remove_from_team", MessageType::REMOVE_FROM_TEAM},
        {"system_combined_user_activity", MessageType::COMBINED_USER_ACTIVITY},
        {"system_header_change", MessageType::HEADER_CHANGE},
        {"system_displayname_change", MessageType::DISPLAYNAME_CHANGE},
        {"system_purpose_change", MessageType::PURPOSE_CHANGE},
        {"system_channel_deleted", MessageType::CHANNEL_DELETED},
        {"system_ephemeral", MessageType::EPHEMERAL},
    };

    auto it = types.find(type);
    if (it != types.end()) {
        return it->second;
    }
    if (type.rfind("system_", 0) == 0) {
        return MessageType::SYSTEM_OTHER;
    }
    return MessageType::DEFAULT;
}

Message Message::fromJson(const nlohmann::json &j) {
    Message message;

    message.id = j.at("id").get<std::string>();
    message.channelId = j.at("channel_id").get<std::string>();
    message.authorId = readString(j, "user_id");
    message.content = readString(j, "message");
    message.rootId = readString(j, "root_id");
    message.type = parseMessageType(readString(j, "type"));

    auto created = readTimestamp(j, "create_at");
    if (created.has_value()) {
        message.createAt = *created;
    } else {
        message.createAt = std::chrono::system_clock::now();
    }
    message.editAt = readTimestamp(j, "edit_at");
    message.deleteAt = readTimestamp(j, "delete_at");

    if (j.contains("reply_count") && j["reply_count"].is_number_integer()) {
        message.replyCount = j["reply_count"].get<int>();
    }

    if (j.contains("pending_post_id") && j["pending_post_id"].is_string()) {
        std::string pendingId = j["pending_post_id"].get<std::string>();
        if (!pendingId.empty()) {
            message.pendingPostId = pendingId;
        }
    }

    if (j.contains("failed") && j["failed"].is_boolean()) {
        message.failed = j["failed"].get<bool>();
    }

    if (j.contains("props") && j["props"].is_object()) {
        const auto &props = j["props"];
        message.subjectUserId = readString(props, "userId");
        message.subjectUsername = readString(props, "username");
        message.addedUserId = readString(props, "addedUserId");
        message.addedUsername = readString(props, "addedUsername");
        message.removedUserId = readString(props, "removedUserId");
        message.removedUsername = readString(props, "removedUsername");
    }

    if (j.contains("metadata") && j["metadata"].is_object()) {
        const auto &metadata = j["metadata"];
        if (metadata.contains("files") && metadata["files"].is_array()) {
            for (const auto &fileJson : metadata["files"]) {
                message.attachments.push_back(Attachment::fromJson(fileJson));
            }
        }
        if (metadata.contains("reactions") && metadata["reactions"].is_array()) {
            for (const auto &reactionJson : metadata["reactions"]) {
                message.reactions.push_back(Reaction::fromJson(reactionJson));
            }
        }
    }

    if (message.attachments.empty() && j.contains("file_ids") && j["file_ids"].is_array()) {
        for (const auto &fileId : j["file_ids"]) {
            if (fileId.is_string()) {
                message.attachments.push_back(Attachment::fromJson(fileId));
            }
        }
    }

    if (j.contains("user_activity_posts") && j["user_activity_posts"].is_array()) {
        for (const auto &childJson : j["user_activity_posts"]) {
            message.activityPosts.push_back(Message::fromJson(childJson));
        }
    }

    return message;
}

bool Message::isJoinLeaveMessage() const {
    switch (type) {
    case MessageType::JOIN_LEAVE:
    case MessageType::JOIN_CHANNEL:
    case MessageType::LEAVE_CHANNEL:
    case MessageType::ADD_REMOVE:
    case MessageType::ADD_TO_CHANNEL:
    case MessageType::REMOVE_FROM_CHANNEL:
    case MessageType::JOIN_TEAM:
    case MessageType::LEAVE_TEAM:
    case MessageType::ADD_TO_TEAM:
    case MessageType::REMOVE_FROM_TEAM:
    case MessageType::COMBINED_USER_ACTIVITY:
        return true;
    default:
        return false;
    }
}

bool Message::referencesUser(const std::string &userId, const std::string &username) const {
    for (const auto &child : activityPosts) {
        if (child.referencesUser(userId, username)) {
            return true;
        }
    }

    if (!userId.empty() && (authorId == userId || subjectUserId == userId || addedUserId == userId ||
                            removedUserId == userId)) {
        return true;
    }

    return !username.empty() &&
           (subjectUsername == username || addedUsername == username || removedUsername == username);
}

int Message::lineBreakCount() const { return static_cast<int>(std::count(content.begin(), content.end(), '\n')); }

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/Attachment.h"
#include "models/Reaction.h"

/**
 * @brief Message types, keyed by the server's type string
 * Everything but DEFAULT is a system message.
 */
enum class MessageType {
    DEFAULT,                ///< ""
    JOIN_LEAVE,             ///< "system_join_leave"
    JOIN_CHANNEL,           ///< "system_join_channel"
    LEAVE_CHANNEL,          ///< "system_leave_channel"
    ADD_REMOVE,             ///< "system_add_remove"
    ADD_TO_CHANNEL,         ///< "system_add_to_channel"
    REMOVE_FROM_CHANNEL,    ///< "system_remove_from_channel"
    JOIN_TEAM,              ///< "system_join_team"
    LEAVE_TEAM,             ///< "system_leave_team"
    ADD_TO_TEAM,            ///< "system_add_to_team"
    REMOVE_FROM_TEAM,       ///< "system_remove_from_team"
    COMBINED_USER_ACTIVITY, ///< "system_combined_user_activity"
    HEADER_CHANGE,          ///< "system_header_change"
    DISPLAYNAME_CHANGE,     ///< "system_displayname_change"
    PURPOSE_CHANGE,         ///< "system_purpose_change"
    CHANNEL_DELETED,        ///< "system_channel_deleted"
    EPHEMERAL,              ///< "system_ephemeral"
    SYSTEM_OTHER            ///< any other "system_" type
};

/**
 * @brief Map a server type string to a MessageType
 */
MessageType parseMessageType(const std::string &type);

/**
 * @brief Represents a message in a conversation
 *
 * Records are immutable once stored; an edit replaces the whole record.
 */
class Message {
  public:
    /**
     * @brief Deserialize message from a post JSON object
     * @param j JSON object from the server
     * @return Message instance
     */
    static Message fromJson(const nlohmann::json &j);

    /**
     * @brief Check if message is a system message
     * @return true if message is system-generated
     */
    bool isSystemMessage() const { return type != MessageType::DEFAULT; }

    /**
     * @brief Check if message reports membership activity (join/leave/add/remove)
     * These are hidden when the viewer disables join/leave messages.
     */
    bool isJoinLeaveMessage() const;

    /**
     * @brief Check if the message, or any activity it aggregates, is about the given user
     * @param userId User ID to look for as subject, adder or remover
     * @param username Username to look for (may be empty)
     */
    bool referencesUser(const std::string &userId, const std::string &username) const;

    /**
     * @brief Check if message is a thread reply
     */
    bool isReply() const { return !rootId.empty(); }

    /**
     * @brief Check if message was edited
     */
    bool wasEdited() const { return editAt.has_value(); }

    /**
     * @brief Check if message was deleted on the server
     */
    bool wasDeleted() const { return deleteAt.has_value(); }

    /**
     * @brief Number of explicit line breaks in the text
     */
    int lineBreakCount() const;

    std::string id;                                                  ///< Message ID, unique per conversation
    std::string channelId;                                           ///< Conversation the message belongs to
    std::string authorId;                                            ///< Author user ID
    std::string content;                                             ///< Message text
    std::chrono::system_clock::time_point createAt;                  ///< Creation timestamp
    std::optional<std::chrono::system_clock::time_point> editAt;     ///< Last edit timestamp
    std::optional<std::chrono::system_clock::time_point> deleteAt;   ///< Deletion timestamp
    std::string rootId;                                              ///< Thread root ID, empty if not a reply
    int replyCount = 0;                                              ///< Replies in the thread this message roots
    MessageType type = MessageType::DEFAULT;                         ///< Message type
    std::vector<Attachment> attachments;                             ///< File attachments
    std::vector<Reaction> reactions;                                 ///< Reactions
    bool pending = false;                                            ///< Local send not yet acknowledged
    bool failed = false;                                             ///< Local send failed
    std::optional<std::string> pendingPostId;                        ///< Local ID echoed back by the server
    std::string subjectUserId;                                       ///< Activity subject ("userId" prop)
    std::string subjectUsername;                                     ///< Activity subject ("username" prop)
    std::string addedUserId;                                         ///< "addedUserId" prop
    std::string addedUsername;                                       ///< "addedUsername" prop
    std::string removedUserId;                                       ///< "removedUserId" prop
    std::string removedUsername;                                     ///< "removedUsername" prop
    std::vector<Message> activityPosts;                              ///< Posts folded into a combined activity post
};

using MessagePtr = std::shared_ptr<const Message>;

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "models/Message.h"
#include "models/Reaction.h"

namespace Feed {

/**
 * @brief Real-time event delivered by the push transport
 */
struct PushEvent {
    enum class Kind { MESSAGE_CREATED, MESSAGE_UPDATED, MESSAGE_DELETED, TYPING, REACTION_ADDED, REACTION_REMOVED };

    Kind kind = Kind::TYPING;
    std::string channelId;          ///< Conversation the event concerns
    std::string userId;             ///< Actor (typing, reactions) or author (messages)
    std::string username;           ///< Display name carried by the payload, may be empty
    std::optional<Message> message; ///< Set for the MESSAGE_* kinds
    std::optional<Reaction> reaction;

    /**
     * @brief Decode a {event, data, broadcast} envelope
     *
     * Accepts "posted"/"message-created", "post_edited"/"message-updated",
     * "post_deleted"/"message-deleted", "typing", "reaction_added" and "reaction_removed".
     * Message and reaction payloads may be embedded objects or JSON-encoded strings.
     * @param j Envelope
     * @return Decoded event, std::nullopt for unknown kinds or missing required fields
     */
    static std::optional<PushEvent> fromJson(const nlohmann::json &j);
};

const char *toString(PushEvent::Kind kind);

} // namespace Feed

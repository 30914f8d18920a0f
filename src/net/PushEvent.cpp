#include "net/PushEvent.h"

#include "utils/Logger.h"

namespace Feed {

namespace {

std::optional<PushEvent::Kind> parseKind(const std::string &event) {
    if (event == "posted" || event == "message-created") {
        return PushEvent::Kind::MESSAGE_CREATED;
    }
    if (event == "post_edited" || event == "message-updated") {
        return PushEvent::Kind::MESSAGE_UPDATED;
    }
    if (event == "post_deleted" || event == "message-deleted") {
        return PushEvent::Kind::MESSAGE_DELETED;
    }
    if (event == "typing") {
        return PushEvent::Kind::TYPING;
    }
    if (event == "reaction_added") {
        return PushEvent::Kind::REACTION_ADDED;
    }
    if (event == "reaction_removed") {
        return PushEvent::Kind::REACTION_REMOVED;
    }
    return std::nullopt;
}

// Payloads arrive either as objects or as JSON text inside a string field.
nlohmann::json unwrap(const nlohmann::json &value) {
    if (value.is_string()) {
        return nlohmann::json::parse(value.get<std::string>());
    }
    return value;
}

std::string readString(const nlohmann::json &j, const char *key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace

const char *toString(PushEvent::Kind kind) {
    switch (kind) {
    case PushEvent::Kind::MESSAGE_CREATED:
        return "message-created";
    case PushEvent::Kind::MESSAGE_UPDATED:
        return "message-updated";
    case PushEvent::Kind::MESSAGE_DELETED:
        return "message-deleted";
    case PushEvent::Kind::TYPING:
        return "typing";
    case PushEvent::Kind::REACTION_ADDED:
        return "reaction-added";
    case PushEvent::Kind::REACTION_REMOVED:
        return "reaction-removed";
    default:
        return "unknown";
    }
}

std::optional<PushEvent> PushEvent::fromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto kind = parseKind(readString(j, "event"));
    if (!kind.has_value()) {
        return std::nullopt;
    }

    const nlohmann::json empty = nlohmann::json::object();
    const auto &data = (j.contains("data") && j["data"].is_object()) ? j["data"] : empty;
    const auto &broadcast = (j.contains("broadcast") && j["broadcast"].is_object()) ? j["broadcast"] : empty;

    PushEvent event;
    event.kind = *kind;
    event.channelId = readString(broadcast, "channel_id");

    try {
        switch (event.kind) {
        case Kind::TYPING:
            event.userId = readString(data, "user_id");
            event.username = readString(data, "username");
            if (event.channelId.empty()) {
                event.channelId = readString(data, "channel_id");
            }
            if (event.userId.empty() || event.channelId.empty()) {
                return std::nullopt;
            }
            break;

        case Kind::MESSAGE_CREATED:
        case Kind::MESSAGE_UPDATED:
        case Kind::MESSAGE_DELETED: {
            if (!data.contains("post")) {
                return std::nullopt;
            }
            Message message = Message::fromJson(unwrap(data["post"]));
            if (message.id.empty()) {
                return std::nullopt;
            }
            if (message.channelId.empty()) {
                message.channelId = event.channelId;
            }
            if (message.channelId.empty()) {
                return std::nullopt;
            }
            event.userId = message.authorId;
            event.username = readString(data, "sender_name");
            if (event.channelId.empty()) {
                event.channelId = message.channelId;
            }
            event.message = std::move(message);
            break;
        }

        case Kind::REACTION_ADDED:
        case Kind::REACTION_REMOVED: {
            if (!data.contains("reaction")) {
                return std::nullopt;
            }
            Reaction reaction = Reaction::fromJson(unwrap(data["reaction"]));
            if (reaction.postId.empty() || reaction.userId.empty() || reaction.emojiName.empty()) {
                return std::nullopt;
            }
            event.userId = reaction.userId;
            event.reaction = std::move(reaction);
            break;
        }
        }
    } catch (const nlohmann::json::exception &e) {
        Logger::debug(std::string("PushEvent: dropping malformed ") + toString(event.kind) + " payload: " + e.what());
        return std::nullopt;
    }

    return event;
}

} // namespace Feed

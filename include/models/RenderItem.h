#pragma once

#include <chrono>
#include <string>

#include "models/Message.h"

enum class RenderItemType { MESSAGE, DATE_SEPARATOR, UNREAD_SEPARATOR, LOAD_MORE, LOADING, START_OF_CONVERSATION };

enum class LoadDirection { OLDER, NEWER };

/**
 * @brief One row handed to the windowing layer
 *
 * The id is stable across rebuilds and keys both measured heights and scroll anchors.
 */
struct RenderItem {
    RenderItemType type = RenderItemType::MESSAGE;
    std::string id;

    MessagePtr message;        ///< MESSAGE only
    bool grouped = false;      ///< Continues the previous message's author run
    bool showHeader = true;    ///< Avatar, name and time are drawn
    bool isOwnMessage = false; ///< Authored by the viewer

    std::chrono::system_clock::time_point date{}; ///< DATE_SEPARATOR only
    int unreadCount = 0;                          ///< UNREAD_SEPARATOR only
    LoadDirection direction = LoadDirection::OLDER; ///< LOAD_MORE and LOADING only

    bool operator==(const RenderItem &other) const {
        return type == other.type && id == other.id && message == other.message && grouped == other.grouped &&
               showHeader == other.showHeader && isOwnMessage == other.isOwnMessage && date == other.date &&
               unreadCount == other.unreadCount && direction == other.direction;
    }

    bool operator!=(const RenderItem &other) const { return !(*this == other); }
};

namespace RenderItemIds {

constexpr const char *DATE_PREFIX = "date-";
constexpr const char *UNREAD_PREFIX = "start-of-new-messages-";
constexpr const char *LOAD_OLDER = "load-older";
constexpr const char *LOAD_NEWER = "load-newer";
constexpr const char *LOADING_OLDER = "loading-older";
constexpr const char *LOADING_NEWER = "loading-newer";
constexpr const char *START_OF_CONVERSATION = "start-of-channel";

/**
 * @brief Check whether an identifier names a marker row rather than a message
 */
bool isMarker(const std::string &id);

} // namespace RenderItemIds

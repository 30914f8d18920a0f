#include "models/RenderItem.h"

namespace RenderItemIds {

namespace {
bool startsWith(const std::string &id, const char *prefix) { return id.rfind(prefix, 0) == 0; }
} // namespace

bool isMarker(const std::string &id) {
    return startsWith(id, DATE_PREFIX) || startsWith(id, UNREAD_PREFIX) || id == LOAD_OLDER || id == LOAD_NEWER ||
           id == LOADING_OLDER || id == LOADING_NEWER || id == START_OF_CONVERSATION;
}

} // namespace RenderItemIds

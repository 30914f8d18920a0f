#include "state/PostsLoader.h"

#include "state/Actions.h"
#include "state/Selectors.h"
#include "utils/Logger.h"

PostsLoader::PostsLoader(Store &store, Feed::PostsSource &source, int pageSize)
    : m_store(store), m_source(source), m_pageSize(pageSize > 0 ? pageSize : 60) {}

void PostsLoader::openChannel(const std::string &channelId) {
    bool needsInitial = false;
    m_store.update([&](AppState &state) {
        Actions::setActiveChannel(state, channelId);
        auto it = state.channelPosts.find(channelId);
        needsInitial = it == state.channelPosts.end() || it->second.order.empty();
    });

    if (needsInitial) {
        loadInitial();
    }
}

bool PostsLoader::loadInitial() { return load(Feed::FetchDirection::INITIAL); }

bool PostsLoader::loadOlder() { return load(Feed::FetchDirection::OLDER); }

bool PostsLoader::loadNewer() { return load(Feed::FetchDirection::NEWER); }

bool PostsLoader::load(Feed::FetchDirection direction) {
    Feed::FetchRequest request;
    request.direction = direction;
    request.perPage = m_pageSize;

    bool started = false;
    m_store.update([&](AppState &state) {
        request.channelId = state.view.channelId;
        request.generation = state.view.generation;
        if (request.channelId.empty()) {
            return;
        }

        if (direction != Feed::FetchDirection::INITIAL) {
            auto it = state.channelPosts.find(request.channelId);
            if (it == state.channelPosts.end()) {
                return;
            }
            request.cursorId = direction == Feed::FetchDirection::OLDER
                                   ? Selectors::oldestMessageId(it->second.order, state.messages)
                                   : Selectors::newestMessageId(it->second.order, state.messages);
            if (!request.cursorId) {
                return;
            }
        }

        started = Actions::beginFetch(state, request);
    });

    if (!started) {
        Logger::debug(std::string("Skipping ") + Feed::toString(direction) + " fetch for '" + request.channelId + "'");
        return false;
    }

    Logger::info(std::string("Fetching ") + Feed::toString(direction) + " page for '" + request.channelId + "'");

    Store &store = m_store;
    ErrorReporter onError = m_onError;
    m_source.fetchPosts(
        request,
        [&store, request](const Feed::FetchResult &result) {
            bool applied = false;
            store.update([&](AppState &state) { applied = Actions::applyFetchResult(state, request, result); });
            if (applied) {
                Logger::debug("Applied " + std::to_string(result.messages.size()) + " message(s) to '" +
                              request.channelId + "'");
            }
        },
        [&store, request, onError](const Feed::FetchError &error) {
            store.update([&](AppState &state) { Actions::failFetch(state, request); });
            Logger::warn(std::string("Fetch ") + Feed::toString(request.direction) + " for '" + request.channelId +
                         "' failed (" + std::to_string(error.code) + "): " + error.message);
            if (onError) {
                onError(request, error);
            }
        });

    return true;
}

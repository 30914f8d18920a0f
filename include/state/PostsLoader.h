#pragma once

#include <functional>
#include <string>

#include "net/PostsSource.h"
#include "state/Store.h"

/**
 * @brief Pages the active conversation in through a PostsSource
 *
 * Requests carry the view generation active when they are sent; completions from an
 * earlier generation are ignored. Nothing is retried here.
 */
class PostsLoader {
  public:
    using ErrorReporter = std::function<void(const Feed::FetchRequest &, const Feed::FetchError &)>;

    PostsLoader(Store &store, Feed::PostsSource &source, int pageSize = 60);

    PostsLoader(const PostsLoader &) = delete;
    PostsLoader &operator=(const PostsLoader &) = delete;

    void setErrorReporter(ErrorReporter reporter) { m_onError = std::move(reporter); }

    /**
     * @brief Make a conversation the active one and load its first page if nothing is cached
     */
    void openChannel(const std::string &channelId);

    bool loadInitial();
    bool loadOlder();
    bool loadNewer();

  private:
    bool load(Feed::FetchDirection direction);

    Store &m_store;
    Feed::PostsSource &m_source;
    int m_pageSize;
    ErrorReporter m_onError;
};

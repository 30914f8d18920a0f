#pragma once

#include "data/FixtureConversation.h"
#include "net/PostsSource.h"

namespace Data {

/**
 * @brief Serves pages of a FixtureConversation on the event loop after a fixed latency
 *
 * When failEvery is positive, every failEvery-th request fails with a 503 so the error
 * path can be seen in the demo.
 */
class FixturePostsSource : public Feed::PostsSource {
  public:
    FixturePostsSource(const FixtureConversation &conversation, double latencySeconds, int failEvery = 0);

    void fetchPosts(const Feed::FetchRequest &request, SuccessCallback onSuccess, ErrorCallback onError) override;

  private:
    const FixtureConversation &m_conversation;
    double m_latencySeconds;
    int m_failEvery;
    int m_requestCount = 0;
};

} // namespace Data

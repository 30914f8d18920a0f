#include "data/FixturePostsSource.h"

#include "ui/EventLoop.h"
#include "utils/Logger.h"

namespace Data {

FixturePostsSource::FixturePostsSource(const FixtureConversation &conversation, double latencySeconds, int failEvery)
    : m_conversation(conversation), m_latencySeconds(latencySeconds), m_failEvery(failEvery) {}

void FixturePostsSource::fetchPosts(const Feed::FetchRequest &request, SuccessCallback onSuccess,
                                    ErrorCallback onError) {
    ++m_requestCount;
    const bool fail = m_failEvery > 0 && m_requestCount % m_failEvery == 0;

    EventLoop::postDelayed(m_latencySeconds, [this, request, fail, onSuccess = std::move(onSuccess),
                                              onError = std::move(onError)]() {
        if (fail) {
            onError(Feed::FetchError{503, "simulated outage"});
            return;
        }

        auto page = m_conversation.page(request);
        if (!page) {
            onError(Feed::FetchError{404, "unknown cursor"});
            return;
        }

        auto result = Feed::FetchResult::fromJson(*page, request.direction);
        if (!result) {
            onError(Feed::FetchError{0, "malformed page"});
            return;
        }

        Logger::debug("Serving " + std::to_string(result->messages.size()) + " post(s) for " +
                      Feed::toString(request.direction) + " request");
        onSuccess(*result);
    });
}

} // namespace Data

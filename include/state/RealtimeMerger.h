#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "net/PushEvent.h"
#include "state/Store.h"

/**
 * @brief Applies push events to the Store and expires typing signals
 *
 * Rendering is never decided here; the list is rebuilt from the updated state.
 */
class RealtimeMerger {
  public:
    RealtimeMerger(Store &store, std::chrono::milliseconds typingTimeout);

    /**
     * @brief Apply one decoded event
     * @param now Steady time stamped on typing signals
     * @return true if the event changed the state
     */
    bool handle(const Feed::PushEvent &event,
                std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Decode and apply a raw envelope; malformed envelopes are dropped
     */
    bool handleJson(const nlohmann::json &envelope,
                    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Remove typing signals older than the timeout
     * @return Number of signals removed
     */
    size_t sweep(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    std::chrono::milliseconds typingTimeout() const { return m_typingTimeout; }
    std::chrono::milliseconds sweepInterval() const { return m_typingTimeout / 2; }

  private:
    bool handleTyping(const Feed::PushEvent &event, std::chrono::steady_clock::time_point now);
    bool handleCreated(const Message &message);
    bool handleUpdated(const Message &message);
    bool handleDeleted(const Feed::PushEvent &event);
    bool handleReaction(const Feed::PushEvent &event);

    Store &m_store;
    std::chrono::milliseconds m_typingTimeout;
};

#pragma once

#include <FL/Fl.H>

#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "data/FixtureConversation.h"
#include "models/Message.h"
#include "state/RealtimeMerger.h"
#include "state/Store.h"

namespace Data {

/**
 * @brief Plays push events into the merger on an FLTK timer
 *
 * New posts are appended to the fixture too, so later page requests see them. The viewer
 * also sends messages: each shows up pending, then the server echo replaces it or the send
 * is marked failed.
 */
class DemoFeed {
  public:
    DemoFeed(FixtureConversation &conversation, Store &store, RealtimeMerger &merger, double intervalSeconds);
    ~DemoFeed();

    DemoFeed(const DemoFeed &) = delete;
    DemoFeed &operator=(const DemoFeed &) = delete;

    void start();
    void stop();

    /**
     * @brief Add a message from the viewer as pending
     * @return The pending ID
     */
    std::string sendLocal(const std::string &text);

    /**
     * @brief Settle the outstanding local send
     * @param delivered true to echo it back as a server post, false to mark it failed
     * @return false if nothing was outstanding
     */
    bool completeLocalSend(bool delivered);

  private:
    void tick();
    void emit(const nlohmann::json &envelope);
    const User &randomPeer();
    nlohmann::json typingEnvelope(const std::string &userId);
    nlohmann::json postedEnvelope(const std::string &userId);
    static void timerCallback(void *data);

    FixtureConversation &m_conversation;
    Store &m_store;
    RealtimeMerger &m_merger;
    double m_intervalSeconds;
    bool m_running = false;
    uint64_t m_step = 0;
    uint64_t m_nextPostNumber = 1;
    uint64_t m_localSends = 0;
    std::string m_pendingAuthor;
    std::optional<Message> m_outstandingSend;
    std::mt19937 m_rng{42};
};

} // namespace Data

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "net/PostsSource.h"
#include "state/AppState.h"

/**
 * Mutators applied through Store::update. Each keeps the state invariants:
 * no duplicate IDs in a channel's order, boundary flags set only by fetch results.
 */
namespace Actions {

/**
 * @brief Switch the displayed conversation and start a new view generation
 * Fetches dispatched under the previous generation are discarded when they complete.
 * @return The new generation
 */
uint64_t setActiveChannel(AppState &state, const std::string &channelId);

/**
 * @brief Mark a fetch as in flight
 * @return false if a fetch is already running for the channel or the boundary in that direction is reached
 */
bool beginFetch(AppState &state, const Feed::FetchRequest &request);

/**
 * @brief Merge a completed page into the channel
 * @return false if the request belongs to a stale view generation (nothing applied)
 */
bool applyFetchResult(AppState &state, const Feed::FetchRequest &request, const Feed::FetchResult &result);

/**
 * @brief Clear the loading flag after a failed fetch; order and boundaries stay untouched
 */
void failFetch(AppState &state, const Feed::FetchRequest &request);

/**
 * @brief Add or replace a message record and place it in its channel
 *
 * Thread replies are stored without entering the channel order. A server echo carrying
 * pendingPostId takes over the pending message's slot. A new message enters the head of
 * the order only while the channel is at its newest boundary.
 * @return true if the channel order changed
 */
bool upsertMessage(AppState &state, const Message &message);

/**
 * @brief Remove a message record and its position
 * @return The removed record, nullptr if unknown
 */
MessagePtr removeMessage(AppState &state, const std::string &messageId);

/**
 * @brief Show a locally composed message at the head of its channel before the send completes
 */
void addPendingMessage(AppState &state, Message message);

/**
 * @brief Generate an ID for a locally composed message
 */
std::string generatePendingId();

/**
 * @brief Flag a pending message as failed
 * @return false if the message is unknown
 */
bool markMessageFailed(AppState &state, const std::string &messageId);

/**
 * @brief Record that the viewer has read the channel up to now
 */
void markAsRead(AppState &state, const std::string &channelId, std::chrono::system_clock::time_point now);

bool addReaction(AppState &state, const Reaction &reaction);
bool removeReaction(AppState &state, const Reaction &reaction);

/**
 * @brief Insert or refresh the typing signal of (channel, user)
 */
void upsertTyping(AppState &state, const TypingSignal &signal);

/**
 * @brief Forget the typing signal of (channel, user), e.g. once the user's message arrived
 * @return true if a signal was removed
 */
bool removeTyping(AppState &state, const std::string &channelId, const std::string &userId);

/**
 * @brief Drop typing signals older than the timeout
 * @return Number of signals removed
 */
size_t sweepTyping(AppState &state, std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout);

} // namespace Actions

#pragma once

#include <FL/Fl_Group.H>

#include <functional>
#include <string>
#include <unordered_map>

#include "state/Selectors.h"
#include "state/Store.h"
#include "ui/SizeEstimator.h"
#include "ui/VirtualScroll.h"
#include "utils/Settings.h"

/**
 * @brief Virtualized message list of one conversation
 *
 * Only rows inside the window plus overscan are measured and drawn. Every rebuild and
 * every batch of new measurements is wrapped in the anchor capture/restore protocol so
 * the content under the reader does not move.
 */
class MessageListView : public Fl_Group {
  public:
    using Callback = std::function<void()>;

    MessageListView(int x, int y, int w, int h, Store &store, const Settings &settings);
    ~MessageListView();

    void draw() override;
    int handle(int event) override;
    void resize(int x, int y, int w, int h) override;

    /**
     * @brief Show a conversation; measurements of the previous one are discarded
     */
    void setChannel(const std::string &channelId);
    const std::string &getChannelId() const { return m_channelId; }

    /**
     * @brief Open or close the inline editor of a message (empty ID closes it)
     */
    void setEditingMessage(const std::string &messageId);

    /**
     * @brief Bring the unread separator to the upper part of the viewport
     * @return false if there is no unread separator
     */
    bool jumpToUnread();
    void scrollToBottom();

    void setOnRequestOlder(Callback callback) { m_onRequestOlder = std::move(callback); }
    void setOnRequestNewer(Callback callback) { m_onRequestNewer = std::move(callback); }
    void setOnReachedUnread(Callback callback) { m_onReachedUnread = std::move(callback); }
    void setOnAtBottom(Callback callback) { m_onAtBottom = std::move(callback); }

    const VirtualScroll::Virtualizer &virtualizer() const { return m_virtualizer; }

  private:
    void unsubscribeAll();
    void applyInputs(const FeedInputs &inputs);
    void positionInitially();
    void syncViewport();
    void measureRenderRange();
    int paintItem(const RenderItem &item, int top, bool render);
    int paintMessage(const RenderItem &item, int top, bool render);
    int paintDateSeparator(const RenderItem &item, int top, bool render);
    int paintUnreadSeparator(const RenderItem &item, int top, bool render);
    int paintLoader(const RenderItem &item, int top, bool render);
    int paintStartOfConversation(int top, bool render);
    void drawScrollbar();
    void drawTypingBar();
    int listHeight() const;
    int itemAt(int mx, int my) const;
    void scrollByPixels(int delta);
    void scheduleIntentCheck();
    void checkIntents();
    std::string authorName(const Message &message) const;
    static void intentTimerCallback(void *data);

    Store &m_store;
    Settings m_settings;
    VirtualScroll::Virtualizer m_virtualizer;
    SizeEstimator::EstimateContext m_estimateContext;

    std::string m_channelId;
    FeedInputs m_inputs;
    std::string m_typingText;
    std::unordered_map<std::string, std::string> m_names;

    Store::ListenerId m_feedListener = 0;
    Store::ListenerId m_typingListener = 0;
    Store::ListenerId m_namesListener = 0;

    Callback m_onRequestOlder;
    Callback m_onRequestNewer;
    Callback m_onReachedUnread;
    Callback m_onAtBottom;

    VirtualScroll::Intents m_lastIntents;
    bool m_intentCheckScheduled = false;
    bool m_initialPositioned = false;
    bool m_followBottom = false;
    int m_measuredWidth = 0;
    bool m_isDestroying = false;
};

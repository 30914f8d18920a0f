#include "ui/components/MessageListView.h"

#include <FL/Fl.H>
#include <FL/fl_draw.H>

#include <algorithm>
#include <chrono>
#include <map>

#include "ui/LayoutConstants.h"
#include "ui/ListBuilder.h"
#include "ui/Theme.h"
#include "utils/Logger.h"
#include "utils/Time.h"

namespace {
constexpr int kHeaderLineHeight = 20;
constexpr int kAttachmentRowHeight = 28;
constexpr int kReactionPillHeight = 24;
constexpr int kReactionRowSpacing = 6;
constexpr int kRepliesLineHeight = 20;
constexpr int kStatusLineHeight = 18;
constexpr int kInlineEditorHeight = 120;
constexpr int kDateSeparatorPadding = 20;
constexpr int kUnreadSeparatorHeight = 28;
constexpr int kLoaderHeight = 40;
constexpr int kStartOfConversationHeight = 96;
constexpr int kMaxMeasurePasses = 3;
constexpr double kUnreadViewportFraction = 0.25;

std::string humanSize(uint64_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string bodyText(const Message &message) {
    if (message.wasDeleted()) {
        return "(message deleted)";
    }
    std::string text = message.content;
    if (message.wasEdited()) {
        text += " (edited)";
    }
    return text;
}

int measureWrapped(const std::string &text, int width) {
    if (text.empty()) {
        return 0;
    }
    int w = std::max(1, width);
    int h = 0;
    fl_measure(text.c_str(), w, h, 0);
    return h;
}
} // namespace

MessageListView::MessageListView(int x, int y, int w, int h, Store &store, const Settings &settings)
    : Fl_Group(x, y, w, h), m_store(store), m_settings(settings),
      m_virtualizer(settings.overscan, settings.bottomThreshold) {
    box(FL_NO_BOX);
    clip_children(1);
    end();

    m_estimateContext.widthClass = SizeEstimator::widthClassFor(w, m_settings.compactBreakpoint);
    m_virtualizer.setEstimator(
        [this](const RenderItem &item) { return SizeEstimator::estimate(item, m_estimateContext); });
    m_virtualizer.setViewportHeight(listHeight());

    m_namesListener = m_store.subscribe<std::unordered_map<std::string, std::string>>(
        [](const AppState &state) { return Selectors::displayNames(state); },
        [this](const std::unordered_map<std::string, std::string> &names) {
            if (m_isDestroying) {
                return;
            }
            m_names = names;
            redraw();
        },
        std::equal_to<std::unordered_map<std::string, std::string>>{}, true);
}

MessageListView::~MessageListView() {
    m_isDestroying = true;
    Fl::remove_timeout(intentTimerCallback, this);
    unsubscribeAll();
    if (m_namesListener) {
        m_store.unsubscribe(m_namesListener);
        m_namesListener = 0;
    }
}

void MessageListView::unsubscribeAll() {
    if (m_feedListener) {
        m_store.unsubscribe(m_feedListener);
        m_feedListener = 0;
    }
    if (m_typingListener) {
        m_store.unsubscribe(m_typingListener);
        m_typingListener = 0;
    }
}

void MessageListView::setChannel(const std::string &channelId) {
    if (channelId == m_channelId) {
        return;
    }

    unsubscribeAll();
    m_channelId = channelId;
    m_virtualizer.reset();
    m_inputs = FeedInputs{};
    m_typingText.clear();
    m_lastIntents = VirtualScroll::Intents{};
    m_initialPositioned = false;
    m_followBottom = false;
    m_estimateContext.editingMessageId.clear();

    if (channelId.empty()) {
        redraw();
        return;
    }

    m_feedListener = m_store.subscribe<FeedInputs>(
        [channelId](const AppState &state) { return Selectors::selectFeedInputs(state, channelId); },
        [this](const FeedInputs &inputs) {
            if (!m_isDestroying) {
                applyInputs(inputs);
            }
        },
        std::equal_to<FeedInputs>{}, true);

    const auto timeout = m_settings.typingTimeout;
    m_typingListener = m_store.subscribe<std::string>(
        [channelId, timeout](const AppState &state) {
            auto signals = Selectors::activeTypers(state, channelId, std::chrono::steady_clock::now(), timeout);
            return Selectors::typingSummary(signals);
        },
        [this](const std::string &summary) {
            if (m_isDestroying) {
                return;
            }
            m_typingText = summary;
            redraw();
        },
        std::equal_to<std::string>{}, true);
}

void MessageListView::applyInputs(const FeedInputs &inputs) {
    m_inputs = inputs;
    syncViewport();

    const bool stickToBottom = m_initialPositioned && m_followBottom;
    auto anchor = m_virtualizer.captureAnchor();

    m_virtualizer.setItems(ListBuilder::buildFeed(inputs, m_settings.groupingWindow));

    if (!m_initialPositioned) {
        positionInitially();
    } else if (stickToBottom) {
        m_virtualizer.scrollToBottom();
    } else if (anchor) {
        m_virtualizer.restoreAnchor(*anchor);
    }

    redraw();
    scheduleIntentCheck();
}

void MessageListView::positionInitially() {
    bool hasMessages = std::any_of(m_virtualizer.items().begin(), m_virtualizer.items().end(),
                                   [](const RenderItem &item) { return item.type == RenderItemType::MESSAGE; });
    if (!hasMessages) {
        return;
    }

    m_initialPositioned = true;
    if (m_virtualizer.scrollToUnread(kUnreadViewportFraction)) {
        m_followBottom = false;
        Logger::debug("Opened '" + m_channelId + "' at the unread separator");
    } else {
        m_virtualizer.scrollToBottom();
        m_followBottom = true;
    }
}

void MessageListView::setEditingMessage(const std::string &messageId) {
    if (messageId == m_estimateContext.editingMessageId) {
        return;
    }

    auto anchor = m_virtualizer.captureAnchor();
    std::string previous = m_estimateContext.editingMessageId;
    m_estimateContext.editingMessageId = messageId;
    if (!previous.empty()) {
        m_virtualizer.invalidate(previous);
    }
    if (!messageId.empty()) {
        m_virtualizer.invalidate(messageId);
    }
    if (anchor) {
        m_virtualizer.restoreAnchor(*anchor);
    }
    redraw();
}

bool MessageListView::jumpToUnread() {
    if (!m_virtualizer.scrollToUnread(kUnreadViewportFraction)) {
        return false;
    }
    m_followBottom = m_virtualizer.isAtBottom();
    redraw();
    scheduleIntentCheck();
    return true;
}

void MessageListView::scrollToBottom() {
    m_virtualizer.scrollToBottom();
    m_followBottom = true;
    redraw();
    scheduleIntentCheck();
}

int MessageListView::listHeight() const { return std::max(0, h() - LayoutConstants::kTypingBarHeight); }

void MessageListView::syncViewport() {
    m_virtualizer.setViewportHeight(listHeight());

    if (m_measuredWidth == w()) {
        return;
    }
    m_measuredWidth = w();
    m_estimateContext.widthClass = SizeEstimator::widthClassFor(w(), m_settings.compactBreakpoint);

    auto anchor = m_virtualizer.captureAnchor();
    m_virtualizer.clearMeasurements();
    if (m_followBottom) {
        m_virtualizer.scrollToBottom();
    } else if (anchor) {
        m_virtualizer.restoreAnchor(*anchor);
    }
}

void MessageListView::measureRenderRange() {
    for (int pass = 0; pass < kMaxMeasurePasses; ++pass) {
        VirtualScroll::ViewportRange range = m_virtualizer.range();
        if (range.renderLast < range.renderFirst) {
            return;
        }

        auto anchor = m_virtualizer.captureAnchor();
        bool changed = false;
        const auto &items = m_virtualizer.items();
        for (int i = range.renderFirst; i <= range.renderLast; ++i) {
            const RenderItem &item = items[i];
            if (m_virtualizer.heightCache().hasMeasured(item.id)) {
                continue;
            }
            changed |= m_virtualizer.measure(item.id, paintItem(item, 0, false));
        }

        if (!changed) {
            return;
        }
        if (m_followBottom) {
            m_virtualizer.scrollToBottom();
        } else if (anchor) {
            m_virtualizer.restoreAnchor(*anchor);
        }
    }
}

void MessageListView::draw() {
    if (m_isDestroying) {
        return;
    }

    syncViewport();
    measureRenderRange();

    const int listH = listHeight();
    fl_push_clip(x(), y(), w(), listH);

    fl_color(ThemeColors::FEED_BG);
    fl_rectf(x(), y(), w(), h());

    const int slack = std::max(0, listH - m_virtualizer.totalHeight());
    const int baseY = y() + slack - m_virtualizer.scrollOffset();

    VirtualScroll::ViewportRange range = m_virtualizer.range();
    const auto &items = m_virtualizer.items();
    for (int i = range.firstVisible; i <= range.lastVisible; ++i) {
        paintItem(items[i], baseY + m_virtualizer.offsetAt(i), true);
    }

    drawScrollbar();
    fl_pop_clip();

    drawTypingBar();
    scheduleIntentCheck();
}

int MessageListView::paintItem(const RenderItem &item, int top, bool render) {
    switch (item.type) {
    case RenderItemType::MESSAGE:
        return paintMessage(item, top, render);
    case RenderItemType::DATE_SEPARATOR:
        return paintDateSeparator(item, top, render);
    case RenderItemType::UNREAD_SEPARATOR:
        return paintUnreadSeparator(item, top, render);
    case RenderItemType::LOAD_MORE:
    case RenderItemType::LOADING:
        return paintLoader(item, top, render);
    case RenderItemType::START_OF_CONVERSATION:
        return paintStartOfConversation(top, render);
    }
    return 0;
}

std::string MessageListView::authorName(const Message &message) const {
    auto it = m_names.find(message.authorId);
    if (it != m_names.end() && !it->second.empty()) {
        return it->second;
    }
    return Selectors::UNKNOWN_USER_NAME;
}

int MessageListView::paintMessage(const RenderItem &item, int top, bool render) {
    if (!item.message) {
        return 0;
    }
    const Message &message = *item.message;
    const int contentX = x() + LayoutConstants::kMessageContentIndent;
    const int contentW = std::max(1, w() - LayoutConstants::kMessageContentIndent - LayoutConstants::kMessagePaddingX -
                                         LayoutConstants::kScrollbarWidth);

    int cursor = top + (item.grouped ? 2 : LayoutConstants::kMessagePaddingY);

    if (item.showHeader && !message.isSystemMessage()) {
        if (render) {
            const int avatarX = x() + LayoutConstants::kMessagePaddingX;
            const int size = LayoutConstants::kUserAvatarSize;
            std::string name = authorName(message);

            fl_color(ThemeColors::AVATAR_BG);
            fl_pie(avatarX, cursor, size, size, 0, 360);
            fl_color(ThemeColors::TEXT_BODY);
            fl_font(FL_HELVETICA_BOLD, LayoutConstants::kHeaderFontSize);
            std::string initial = name.substr(0, 1);
            fl_draw(initial.c_str(), avatarX, cursor, size, size, FL_ALIGN_CENTER);

            fl_color(ThemeColors::authorColor(message.authorId, item.isOwnMessage));
            fl_draw(name.c_str(), contentX, cursor + 15);
            int nameWidth = static_cast<int>(fl_width(name.c_str()));

            fl_font(FL_HELVETICA, LayoutConstants::kMetaFontSize);
            fl_color(ThemeColors::TEXT_META);
            std::string clock = TimeUtils::formatClock(message.createAt);
            fl_draw(clock.c_str(), contentX + nameWidth + 8, cursor + 15);
        }
        cursor += kHeaderLineHeight;
    }

    const bool editing = !m_estimateContext.editingMessageId.empty() && m_estimateContext.editingMessageId == message.id;
    if (editing) {
        if (render) {
            fl_color(ThemeColors::INLINE_BOX_BG);
            fl_rectf(contentX, cursor, contentW, kInlineEditorHeight);
            fl_color(ThemeColors::INLINE_BOX_BORDER);
            fl_rect(contentX, cursor, contentW, kInlineEditorHeight);
            fl_font(FL_HELVETICA, LayoutConstants::kMessageFontSize);
            fl_color(ThemeColors::TEXT_BODY);
            fl_draw(message.content.c_str(), contentX + 8, cursor + 8, contentW - 16, kInlineEditorHeight - 16,
                    FL_ALIGN_LEFT | FL_ALIGN_TOP | FL_ALIGN_WRAP | FL_ALIGN_CLIP, nullptr, 0);
        }
        cursor += kInlineEditorHeight;
    } else {
        std::string text = bodyText(message);
        fl_font(message.isSystemMessage() ? FL_HELVETICA_ITALIC : FL_HELVETICA, LayoutConstants::kMessageFontSize);
        int textH = measureWrapped(text, contentW);
        if (render && textH > 0) {
            Fl_Color color = ThemeColors::TEXT_BODY;
            if (message.isSystemMessage() || message.pending || message.wasDeleted()) {
                color = ThemeColors::TEXT_META;
            }
            fl_color(color);
            fl_draw(text.c_str(), contentX, cursor, contentW, textH, FL_ALIGN_LEFT | FL_ALIGN_TOP | FL_ALIGN_WRAP,
                    nullptr, 0);
        }
        cursor += textH;
    }

    for (const auto &attachment : message.attachments) {
        if (render) {
            fl_color(ThemeColors::INLINE_BOX_BG);
            fl_rectf(contentX, cursor + 2, std::min(contentW, 320), kAttachmentRowHeight - 4);
            fl_font(FL_HELVETICA, LayoutConstants::kMetaFontSize);
            fl_color(ThemeColors::TEXT_LINK);
            std::string label = attachment.name + "  " + humanSize(attachment.size);
            fl_draw(label.c_str(), contentX + 8, cursor + 2, std::min(contentW, 320) - 16, kAttachmentRowHeight - 4,
                    FL_ALIGN_LEFT | FL_ALIGN_CLIP, nullptr, 0);
        }
        cursor += kAttachmentRowHeight;
    }

    if (!message.reactions.empty()) {
        if (render) {
            std::map<std::string, int> counts;
            for (const auto &reaction : message.reactions) {
                counts[reaction.emojiName] += 1;
            }
            int pillX = contentX;
            fl_font(FL_HELVETICA, LayoutConstants::kMetaFontSize);
            for (const auto &[emoji, count] : counts) {
                std::string label = ":" + emoji + ": " + std::to_string(count);
                int pillW = static_cast<int>(fl_width(label.c_str())) + 16;
                fl_color(ThemeColors::REACTION_BG);
                fl_rectf(pillX, cursor + 3, pillW, kReactionPillHeight);
                fl_color(ThemeColors::TEXT_BODY);
                fl_draw(label.c_str(), pillX, cursor + 3, pillW, kReactionPillHeight, FL_ALIGN_CENTER);
                pillX += pillW + kReactionRowSpacing;
            }
        }
        cursor += kReactionPillHeight + kReactionRowSpacing;
    }

    if (message.replyCount > 0) {
        if (render) {
            std::string label = std::to_string(message.replyCount) + (message.replyCount == 1 ? " reply" : " replies");
            fl_font(FL_HELVETICA_BOLD, LayoutConstants::kMetaFontSize);
            fl_color(ThemeColors::TEXT_LINK);
            fl_draw(label.c_str(), contentX, cursor + 14);
        }
        cursor += kRepliesLineHeight;
    }

    if (message.failed) {
        if (render) {
            fl_font(FL_HELVETICA, LayoutConstants::kMetaFontSize);
            fl_color(ThemeColors::STATUS_DANGER);
            fl_draw("Message failed to send", contentX, cursor + 13);
        }
        cursor += kStatusLineHeight;
    }

    int height = cursor - top + LayoutConstants::kMessagePaddingY;
    if (item.showHeader && !message.isSystemMessage()) {
        height = std::max(height, LayoutConstants::kUserAvatarSize + 2 * LayoutConstants::kMessagePaddingY);
    }
    return height;
}

int MessageListView::paintDateSeparator(const RenderItem &item, int top, bool render) {
    if (render) {
        const int lineY = top + kDateSeparatorPadding;
        const int lineMargin = 16;
        const int textPadding = 8;
        std::string label = TimeUtils::formatDateLabel(item.date);

        fl_font(FL_HELVETICA_BOLD, 12);
        int textWidth = static_cast<int>(fl_width(label.c_str()));
        int textX = x() + w() / 2 - textWidth / 2;

        fl_color(ThemeColors::SEPARATOR_LINE);
        fl_line(x() + lineMargin, lineY, textX - textPadding, lineY);
        fl_line(textX + textWidth + textPadding, lineY, x() + w() - lineMargin, lineY);

        fl_color(ThemeColors::TEXT_META);
        fl_draw(label.c_str(), textX, lineY + 4);
    }
    return kDateSeparatorPadding * 2;
}

int MessageListView::paintUnreadSeparator(const RenderItem &item, int top, bool render) {
    if (render) {
        const int lineY = top + kUnreadSeparatorHeight / 2;
        std::string label = item.unreadCount == 1 ? "1 new message" : std::to_string(item.unreadCount) + " new messages";

        fl_font(FL_HELVETICA_BOLD, LayoutConstants::kMetaFontSize);
        int textWidth = static_cast<int>(fl_width(label.c_str()));
        int textX = x() + w() - LayoutConstants::kMessagePaddingX - LayoutConstants::kScrollbarWidth - textWidth;

        fl_color(ThemeColors::UNREAD_SEPARATOR);
        fl_line(x() + LayoutConstants::kMessagePaddingX, lineY, textX - 8, lineY);
        fl_draw(label.c_str(), textX, lineY + 4);
    }
    return kUnreadSeparatorHeight;
}

int MessageListView::paintLoader(const RenderItem &item, int top, bool render) {
    if (render) {
        const char *label = nullptr;
        if (item.type == RenderItemType::LOADING) {
            label = "Loading...";
        } else {
            label = item.direction == LoadDirection::OLDER ? "Load older messages" : "Load newer messages";
        }
        fl_font(FL_HELVETICA, LayoutConstants::kMetaFontSize);
        fl_color(item.type == RenderItemType::LOADING ? ThemeColors::TEXT_META : ThemeColors::TEXT_LINK);
        fl_draw(label, x(), top, w(), kLoaderHeight, FL_ALIGN_CENTER);
    }
    return kLoaderHeight;
}

int MessageListView::paintStartOfConversation(int top, bool render) {
    if (render) {
        const int textX = x() + LayoutConstants::kMessagePaddingX;
        fl_font(FL_HELVETICA_BOLD, 22);
        fl_color(ThemeColors::TEXT_BODY);
        fl_draw("Beginning of the conversation", textX, top + 48);

        fl_font(FL_HELVETICA, LayoutConstants::kMessageFontSize);
        fl_color(ThemeColors::TEXT_META);
        fl_draw("Every message sent here is shown below.", textX, top + 74);
    }
    return kStartOfConversationHeight;
}

void MessageListView::drawScrollbar() {
    const int total = m_virtualizer.totalHeight();
    const int viewH = listHeight();
    if (total <= viewH || viewH <= 0) {
        return;
    }

    const int trackX = x() + w() - LayoutConstants::kScrollbarWidth;
    const int thumbH = std::max(24, static_cast<int>(static_cast<long long>(viewH) * viewH / total));
    const int maxScroll = std::max(1, m_virtualizer.maxScrollOffset());
    const int thumbY =
        y() + static_cast<int>(static_cast<long long>(viewH - thumbH) * m_virtualizer.scrollOffset() / maxScroll);

    fl_color(ThemeColors::SCROLL_TRACK);
    fl_rectf(trackX, y(), LayoutConstants::kScrollbarWidth, viewH);
    fl_color(ThemeColors::SCROLL_THUMB);
    fl_rectf(trackX + 2, thumbY, LayoutConstants::kScrollbarWidth - 4, thumbH);
}

void MessageListView::drawTypingBar() {
    const int barY = y() + listHeight();
    fl_color(ThemeColors::FEED_BG);
    fl_rectf(x(), barY, w(), LayoutConstants::kTypingBarHeight);

    if (m_typingText.empty()) {
        return;
    }
    fl_font(FL_HELVETICA_ITALIC, LayoutConstants::kMetaFontSize);
    fl_color(ThemeColors::TEXT_META);
    fl_draw(m_typingText.c_str(), x() + LayoutConstants::kMessagePaddingX, barY, w(), LayoutConstants::kTypingBarHeight,
            FL_ALIGN_LEFT | FL_ALIGN_INSIDE, nullptr, 0);
}

int MessageListView::itemAt(int mx, int my) const {
    if (mx < x() || mx >= x() + w() || my < y() || my >= y() + listHeight()) {
        return -1;
    }
    const int slack = std::max(0, listHeight() - m_virtualizer.totalHeight());
    const int contentY = my - y() - slack + m_virtualizer.scrollOffset();

    VirtualScroll::ViewportRange range = m_virtualizer.range();
    for (int i = range.firstVisible; i <= range.lastVisible; ++i) {
        int top = m_virtualizer.offsetAt(i);
        if (contentY >= top && contentY < top + m_virtualizer.heightAt(i)) {
            return i;
        }
    }
    return -1;
}

void MessageListView::scrollByPixels(int delta) {
    if (delta == 0) {
        return;
    }
    m_virtualizer.scrollBy(delta);
    m_followBottom = m_virtualizer.isAtBottom();
    redraw();
    scheduleIntentCheck();
}

int MessageListView::handle(int event) {
    int handled = Fl_Group::handle(event);

    switch (event) {
    case FL_MOUSEWHEEL: {
        if (!Fl::event_inside(x(), y(), w(), listHeight())) {
            break;
        }
        scrollByPixels(Fl::event_dy() * LayoutConstants::kWheelStep);
        return 1;
    }
    case FL_PUSH: {
        take_focus();
        int index = itemAt(Fl::event_x(), Fl::event_y());
        if (index < 0) {
            return 1;
        }
        const RenderItem &item = m_virtualizer.items()[index];
        if (item.type == RenderItemType::LOAD_MORE) {
            Callback &callback = item.direction == LoadDirection::OLDER ? m_onRequestOlder : m_onRequestNewer;
            if (callback) {
                callback();
            }
        }
        return 1;
    }
    case FL_FOCUS:
    case FL_UNFOCUS:
        return 1;
    case FL_KEYBOARD: {
        const int page = std::max(LayoutConstants::kWheelStep, listHeight() - LayoutConstants::kWheelStep);
        switch (Fl::event_key()) {
        case FL_Page_Up:
            scrollByPixels(-page);
            return 1;
        case FL_Page_Down:
            scrollByPixels(page);
            return 1;
        case FL_Up:
            scrollByPixels(-LayoutConstants::kWheelStep);
            return 1;
        case FL_Down:
            scrollByPixels(LayoutConstants::kWheelStep);
            return 1;
        case FL_End:
            scrollToBottom();
            return 1;
        case 'u':
            jumpToUnread();
            return 1;
        default:
            break;
        }
        break;
    }
    default:
        break;
    }

    return handled;
}

void MessageListView::resize(int x, int y, int w, int h) {
    Fl_Group::resize(x, y, w, h);
    syncViewport();
    redraw();
}

void MessageListView::scheduleIntentCheck() {
    if (m_intentCheckScheduled || m_isDestroying) {
        return;
    }
    m_intentCheckScheduled = true;
    Fl::add_timeout(0.0, intentTimerCallback, this);
}

void MessageListView::intentTimerCallback(void *data) {
    auto *view = static_cast<MessageListView *>(data);
    view->m_intentCheckScheduled = false;
    view->checkIntents();
}

void MessageListView::checkIntents() {
    if (m_channelId.empty() || !m_initialPositioned) {
        return;
    }

    VirtualScroll::Intents intents = m_virtualizer.intents();
    VirtualScroll::Intents previous = m_lastIntents;
    m_lastIntents = intents;

    if (intents.requestOlderPage && !previous.requestOlderPage && m_onRequestOlder) {
        m_onRequestOlder();
    }
    if (intents.requestNewerPage && !previous.requestNewerPage && m_onRequestNewer) {
        m_onRequestNewer();
    }
    if (intents.reachedUnreadBoundary && !previous.reachedUnreadBoundary && m_onReachedUnread) {
        m_onReachedUnread();
    }
    if (intents.atBottom && m_inputs.unreadCount > 0 && m_onAtBottom) {
        m_onAtBottom();
    }
}

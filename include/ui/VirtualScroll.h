#ifndef SCROLLBACK_VIRTUAL_SCROLL_H
#define SCROLLBACK_VIRTUAL_SCROLL_H

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "models/RenderItem.h"

namespace VirtualScroll {

struct ViewportRange {
    int firstVisible;
    int lastVisible;
    int renderFirst;
    int renderLast;

    bool empty() const { return lastVisible < firstVisible; }
};

/**
 * @brief Visible and rendered index ranges for a scroll position
 * @param overscanItems Items rendered beyond each edge of the viewport
 */
ViewportRange calculateRange(int scrollOffset, int viewportHeight, const std::vector<int> &itemOffsets,
                             const std::vector<int> &itemHeights, int overscanItems);

/**
 * @brief Measured heights keyed by render item ID
 * Entries override the estimate until forgotten.
 */
class HeightCache {
  public:
    HeightCache() = default;
    void setMeasured(const std::string &id, int height);
    std::optional<int> measured(const std::string &id) const;
    bool hasMeasured(const std::string &id) const { return m_measured.count(id) > 0; }
    void forget(const std::string &id);
    void retainOnly(const std::unordered_set<std::string> &ids);
    void clear() { m_measured.clear(); }
    size_t size() const { return m_measured.size(); }

  private:
    std::unordered_map<std::string, int> m_measured;
};

/**
 * @brief Position of an anchor row relative to the top of the viewport
 */
struct ScrollAnchor {
    std::string id;
    int viewportTop = 0;
};

/**
 * @brief Requests the list makes to its host after a scroll or layout change
 */
struct Intents {
    bool requestOlderPage = false;
    bool requestNewerPage = false;
    bool reachedUnreadBoundary = false;
    bool atBottom = false;

    bool operator==(const Intents &other) const {
        return requestOlderPage == other.requestOlderPage && requestNewerPage == other.requestNewerPage &&
               reachedUnreadBoundary == other.reachedUnreadBoundary && atBottom == other.atBottom;
    }
    bool operator!=(const Intents &other) const { return !(*this == other); }
};

/**
 * @brief Window over a render item sequence
 *
 * Heights come from the measured cache when present and from the estimator otherwise.
 * Content shifts are compensated with captureAnchor() before the mutation and
 * restoreAnchor() once the new items are laid out.
 */
class Virtualizer {
  public:
    using Estimator = std::function<int(const RenderItem &)>;

    explicit Virtualizer(int overscan = 90, int bottomThreshold = 10);

    void setEstimator(Estimator estimator);
    void setItems(std::vector<RenderItem> items);
    const std::vector<RenderItem> &items() const { return m_items; }
    std::optional<size_t> indexOf(const std::string &id) const;

    void setViewportHeight(int height);
    int viewportHeight() const { return m_viewportHeight; }

    void setScrollOffset(int offset);
    void scrollBy(int delta) { setScrollOffset(m_scrollOffset + delta); }
    int scrollOffset() const { return m_scrollOffset; }
    int maxScrollOffset() const;

    /**
     * @brief Record the drawn height of a row
     * A non-positive height counts as a failed measurement.
     * @return true if the layout changed
     */
    bool measure(const std::string &id, int height);

    /**
     * @brief Drop the measured height of a row so its estimate applies again
     */
    void measurementFailed(const std::string &id);

    /**
     * @brief Re-estimate a row, e.g. after its editor opened or closed
     */
    void invalidate(const std::string &id);

    /**
     * @brief Forget every measured height, e.g. after the view width changed
     */
    void clearMeasurements();

    ViewportRange range() const;
    int offsetAt(size_t index) const;
    int heightAt(size_t index) const;
    int totalHeight() const;
    const std::vector<int> &offsets() const;
    const std::vector<int> &heights() const { return m_heights; }
    const HeightCache &heightCache() const { return m_cache; }

    /**
     * @brief Pick the second visible row (the first when only one is visible) as anchor
     * @return std::nullopt if nothing is visible
     */
    std::optional<ScrollAnchor> captureAnchor() const;

    /**
     * @brief Scroll so the anchor row is back at its recorded viewport position
     * @return false if the anchor is no longer in the sequence
     */
    bool restoreAnchor(const ScrollAnchor &anchor);

    /**
     * @brief Bring a row's top to a fraction of the viewport height (0 = top, 1 = bottom)
     * @return false if index is out of range
     */
    bool scrollToIndex(size_t index, double viewportFraction);

    /**
     * @brief scrollToIndex on the unread separator
     * @return false if the sequence has no unread separator
     */
    bool scrollToUnread(double viewportFraction);

    void scrollToBottom();
    bool isAtBottom() const;

    Intents intents() const;

    /**
     * @brief Discard items, measurements and scroll position
     */
    void reset();

  private:
    int resolveHeight(const RenderItem &item) const;
    void rebuildHeights();
    void rebuildOffsets() const;
    void clampScroll();

    int m_overscan;
    int m_bottomThreshold;
    Estimator m_estimator;

    std::vector<RenderItem> m_items;
    std::unordered_map<std::string, size_t> m_indexById;
    HeightCache m_cache;

    std::vector<int> m_heights;
    mutable std::vector<int> m_offsets;
    mutable bool m_offsetsDirty = false;

    int m_viewportHeight = 0;
    int m_scrollOffset = 0;
};

} // namespace VirtualScroll

#endif

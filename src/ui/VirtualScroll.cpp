#include "ui/VirtualScroll.h"

#include <algorithm>
#include <cmath>

#include "ui/LayoutConstants.h"
#include "ui/ListBuilder.h"
#include "utils/Logger.h"

namespace VirtualScroll {

ViewportRange calculateRange(int scrollOffset, int viewportHeight, const std::vector<int> &itemOffsets,
                             const std::vector<int> &itemHeights, int overscanItems) {
    ViewportRange range;
    if (itemOffsets.empty() || itemHeights.size() != itemOffsets.size()) {
        range.firstVisible = 0;
        range.lastVisible = -1;
        range.renderFirst = 0;
        range.renderLast = -1;
        return range;
    }

    int viewportTop = std::max(0, scrollOffset);
    int viewportBottom = viewportTop + std::max(0, viewportHeight);
    int numItems = static_cast<int>(itemOffsets.size());

    auto firstAfterTop = std::upper_bound(itemOffsets.begin(), itemOffsets.end(), viewportTop);
    range.firstVisible = std::max(0, static_cast<int>(firstAfterTop - itemOffsets.begin()) - 1);
    while (range.firstVisible < numItems - 1 &&
           itemOffsets[range.firstVisible] + itemHeights[range.firstVisible] <= viewportTop) {
        ++range.firstVisible;
    }

    auto firstAtBottom = std::lower_bound(itemOffsets.begin(), itemOffsets.end(), viewportBottom);
    range.lastVisible = static_cast<int>(firstAtBottom - itemOffsets.begin()) - 1;

    int overscan = std::max(0, overscanItems);
    if (range.lastVisible < range.firstVisible) {
        range.renderFirst = std::max(0, range.firstVisible - overscan);
        range.renderLast = std::min(numItems - 1, range.firstVisible + overscan);
        return range;
    }

    range.renderFirst = std::max(0, range.firstVisible - overscan);
    range.renderLast = std::min(numItems - 1, range.lastVisible + overscan);
    return range;
}

void HeightCache::setMeasured(const std::string &id, int height) { m_measured[id] = height; }

std::optional<int> HeightCache::measured(const std::string &id) const {
    auto it = m_measured.find(id);
    if (it == m_measured.end()) {
        return std::nullopt;
    }
    return it->second;
}

void HeightCache::forget(const std::string &id) { m_measured.erase(id); }

void HeightCache::retainOnly(const std::unordered_set<std::string> &ids) {
    for (auto it = m_measured.begin(); it != m_measured.end();) {
        if (ids.count(it->first) == 0) {
            it = m_measured.erase(it);
        } else {
            ++it;
        }
    }
}

Virtualizer::Virtualizer(int overscan, int bottomThreshold)
    : m_overscan(std::max(0, overscan)), m_bottomThreshold(std::max(0, bottomThreshold)) {}

void Virtualizer::setEstimator(Estimator estimator) {
    m_estimator = std::move(estimator);
    rebuildHeights();
}

void Virtualizer::setItems(std::vector<RenderItem> items) {
    m_items = std::move(items);

    m_indexById.clear();
    m_indexById.reserve(m_items.size());
    std::unordered_set<std::string> ids;
    ids.reserve(m_items.size());
    for (size_t i = 0; i < m_items.size(); ++i) {
        m_indexById.emplace(m_items[i].id, i);
        ids.insert(m_items[i].id);
    }
    m_cache.retainOnly(ids);

    rebuildHeights();
    clampScroll();
}

std::optional<size_t> Virtualizer::indexOf(const std::string &id) const {
    auto it = m_indexById.find(id);
    if (it == m_indexById.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Virtualizer::setViewportHeight(int height) {
    m_viewportHeight = std::max(0, height);
    clampScroll();
}

void Virtualizer::setScrollOffset(int offset) {
    m_scrollOffset = offset;
    clampScroll();
}

int Virtualizer::maxScrollOffset() const { return std::max(0, totalHeight() - m_viewportHeight); }

bool Virtualizer::measure(const std::string &id, int height) {
    if (height <= 0) {
        bool hadMeasurement = m_cache.hasMeasured(id);
        measurementFailed(id);
        return hadMeasurement;
    }

    m_cache.setMeasured(id, height);

    auto index = indexOf(id);
    if (!index || m_heights[*index] == height) {
        return false;
    }
    m_heights[*index] = height;
    m_offsetsDirty = true;
    return true;
}

void Virtualizer::measurementFailed(const std::string &id) {
    Logger::debug("Measurement unavailable for " + id + ", using estimate");
    invalidate(id);
}

void Virtualizer::invalidate(const std::string &id) {
    m_cache.forget(id);

    auto index = indexOf(id);
    if (!index) {
        return;
    }
    int height = resolveHeight(m_items[*index]);
    if (m_heights[*index] != height) {
        m_heights[*index] = height;
        m_offsetsDirty = true;
    }
}

void Virtualizer::clearMeasurements() {
    m_cache.clear();
    rebuildHeights();
}

ViewportRange Virtualizer::range() const {
    return calculateRange(m_scrollOffset, m_viewportHeight, offsets(), m_heights, m_overscan);
}

int Virtualizer::offsetAt(size_t index) const {
    const auto &all = offsets();
    if (index >= all.size()) {
        return totalHeight();
    }
    return all[index];
}

int Virtualizer::heightAt(size_t index) const {
    if (index >= m_heights.size()) {
        return 0;
    }
    return m_heights[index];
}

int Virtualizer::totalHeight() const {
    if (m_heights.empty()) {
        return 0;
    }
    return offsets().back() + m_heights.back();
}

const std::vector<int> &Virtualizer::offsets() const {
    if (m_offsetsDirty) {
        rebuildOffsets();
    }
    return m_offsets;
}

std::optional<ScrollAnchor> Virtualizer::captureAnchor() const {
    ViewportRange visible = range();
    if (visible.empty()) {
        return std::nullopt;
    }

    int index = visible.lastVisible > visible.firstVisible ? visible.firstVisible + 1 : visible.firstVisible;
    ScrollAnchor anchor;
    anchor.id = m_items[index].id;
    anchor.viewportTop = offsetAt(index) - m_scrollOffset;
    return anchor;
}

bool Virtualizer::restoreAnchor(const ScrollAnchor &anchor) {
    auto index = indexOf(anchor.id);
    if (!index) {
        Logger::debug("Scroll anchor " + anchor.id + " left the list, position not corrected");
        return false;
    }
    setScrollOffset(offsetAt(*index) - anchor.viewportTop);
    return true;
}

bool Virtualizer::scrollToIndex(size_t index, double viewportFraction) {
    if (index >= m_items.size()) {
        return false;
    }
    double fraction = std::min(1.0, std::max(0.0, viewportFraction));
    int target = offsetAt(index) - static_cast<int>(std::lround(fraction * m_viewportHeight));
    setScrollOffset(target);
    return true;
}

bool Virtualizer::scrollToUnread(double viewportFraction) {
    auto index = ListBuilder::findUnreadSeparator(m_items);
    if (!index) {
        return false;
    }
    return scrollToIndex(*index, viewportFraction);
}

void Virtualizer::scrollToBottom() { setScrollOffset(maxScrollOffset()); }

bool Virtualizer::isAtBottom() const { return maxScrollOffset() - m_scrollOffset <= m_bottomThreshold; }

Intents Virtualizer::intents() const {
    Intents result;
    result.atBottom = isAtBottom();

    ViewportRange visible = range();
    if (visible.empty()) {
        return result;
    }

    for (int i = visible.firstVisible; i <= visible.lastVisible; ++i) {
        const RenderItem &item = m_items[i];
        switch (item.type) {
        case RenderItemType::LOAD_MORE:
            if (item.direction == LoadDirection::OLDER) {
                result.requestOlderPage = true;
            } else {
                result.requestNewerPage = true;
            }
            break;
        case RenderItemType::UNREAD_SEPARATOR:
            result.reachedUnreadBoundary = true;
            break;
        default:
            break;
        }
    }
    return result;
}

void Virtualizer::reset() {
    m_items.clear();
    m_indexById.clear();
    m_cache.clear();
    m_heights.clear();
    m_offsets.clear();
    m_offsetsDirty = false;
    m_scrollOffset = 0;
}

int Virtualizer::resolveHeight(const RenderItem &item) const {
    if (auto measured = m_cache.measured(item.id)) {
        return *measured;
    }
    if (m_estimator) {
        int estimate = m_estimator(item);
        if (estimate > 0) {
            return estimate;
        }
    }
    return LayoutConstants::kDefaultItemHeight;
}

void Virtualizer::rebuildHeights() {
    m_heights.resize(m_items.size());
    for (size_t i = 0; i < m_items.size(); ++i) {
        m_heights[i] = resolveHeight(m_items[i]);
    }
    m_offsetsDirty = true;
}

void Virtualizer::rebuildOffsets() const {
    if (m_offsets.size() != m_heights.size()) {
        m_offsets.resize(m_heights.size());
    }

    int cumulativeOffset = 0;
    for (size_t i = 0; i < m_heights.size(); ++i) {
        m_offsets[i] = cumulativeOffset;
        cumulativeOffset += m_heights[i];
    }

    m_offsetsDirty = false;
}

void Virtualizer::clampScroll() { m_scrollOffset = std::min(std::max(0, m_scrollOffset), maxScrollOffset()); }

} // namespace VirtualScroll

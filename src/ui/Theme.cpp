#include "ui/Theme.h"

#include <FL/Fl.H>
#include <FL/fl_draw.H>

#include <functional>
#include <iterator>

#include "ui/LayoutConstants.h"

namespace ThemeColors {

namespace {
constexpr Fl_Color kAuthorPalette[] = {0xE9A23BFF, 0x3BA55DFF, 0xEB459EFF, 0x5865F2FF, 0x1ABC9CFF, 0xF47B67FF};
} // namespace

Fl_Color authorColor(const std::string &userId, bool isViewer) {
    if (isViewer) {
        return TEXT_LINK;
    }
    if (userId.empty()) {
        return TEXT_BODY;
    }
    size_t slot = std::hash<std::string>{}(userId) % std::size(kAuthorPalette);
    return kAuthorPalette[slot];
}

} // namespace ThemeColors

void init_theme() {
    Fl::scheme("gtk+");

    Fl::background(ThemeColors::red(ThemeColors::FEED_BG), ThemeColors::green(ThemeColors::FEED_BG),
                   ThemeColors::blue(ThemeColors::FEED_BG));
    Fl::background2(ThemeColors::red(ThemeColors::INLINE_BOX_BG), ThemeColors::green(ThemeColors::INLINE_BOX_BG),
                    ThemeColors::blue(ThemeColors::INLINE_BOX_BG));
    Fl::foreground(ThemeColors::red(ThemeColors::TEXT_BODY), ThemeColors::green(ThemeColors::TEXT_BODY),
                   ThemeColors::blue(ThemeColors::TEXT_BODY));
    Fl::set_color(FL_SELECTION_COLOR, ThemeColors::TEXT_LINK);
    Fl::visible_focus(0);

    FL_NORMAL_SIZE = LayoutConstants::kMessageFontSize;
}

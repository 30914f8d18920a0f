#pragma once

#include <FL/Fl.H>

#include <string>

namespace ThemeColors {
constexpr Fl_Color FEED_BG = 0x1a1a1eFF;
constexpr Fl_Color SCROLL_TRACK = 0x121214FF;
constexpr Fl_Color SCROLL_THUMB = 0x4e505aFF;
constexpr Fl_Color INLINE_BOX_BG = 0x202024FF; ///< Editor and attachment rows
constexpr Fl_Color INLINE_BOX_BORDER = 0x4e505aFF;
constexpr Fl_Color SEPARATOR_LINE = 0x3f4147FF;

constexpr Fl_Color TEXT_BODY = 0xDCDCDCFF;
constexpr Fl_Color TEXT_META = 0x949ba4FF;
constexpr Fl_Color TEXT_LINK = 0x00a8fcFF;

constexpr Fl_Color AVATAR_BG = 0x2b2b31FF;
constexpr Fl_Color REACTION_BG = 0x2b2d31FF;
constexpr Fl_Color UNREAD_SEPARATOR = 0xF04747FF;
constexpr Fl_Color STATUS_DANGER = 0xF04747FF;

inline constexpr unsigned char red(Fl_Color color) { return (color >> 24) & 0xFF; }
inline constexpr unsigned char green(Fl_Color color) { return (color >> 16) & 0xFF; }
inline constexpr unsigned char blue(Fl_Color color) { return (color >> 8) & 0xFF; }

/**
 * @brief Name color of a message author
 * The viewer's own name uses the link color; everyone else gets a stable color derived from the user ID.
 */
Fl_Color authorColor(const std::string &userId, bool isViewer);
} // namespace ThemeColors

/**
 * @brief Apply the feed palette and base font size to FLTK's defaults
 */
void init_theme();

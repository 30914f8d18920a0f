#pragma once

#include <string>

#include "models/RenderItem.h"

/**
 * Heuristic row heights used until a row has been measured.
 */
namespace SizeEstimator {

enum class WidthClass { REGULAR, COMPACT };

struct EstimateContext {
    std::string editingMessageId; ///< Message whose editor is open, empty if none
    WidthClass widthClass = WidthClass::REGULAR;
};

/**
 * @brief Estimate the height of a row in pixels
 * @param item Row to estimate
 * @param context Editing state and width class of the view
 * @return Estimated height, always positive
 */
int estimate(const RenderItem &item, const EstimateContext &context);

/**
 * @brief Width class for a view of the given width
 */
WidthClass widthClassFor(int viewWidth, int compactBreakpoint);

/**
 * @brief Lines of text a message body takes at the given width class
 */
int estimateTextLines(const Message &message, WidthClass widthClass);

} // namespace SizeEstimator

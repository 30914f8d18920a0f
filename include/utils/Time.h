#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace TimeUtils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Convert a Unix epoch timestamp in milliseconds to a time_point
 * @param ms Milliseconds since the epoch (server timestamps use this unit)
 * @return Corresponding time_point
 */
TimePoint fromUnixMs(int64_t ms);

/**
 * @brief Convert a time_point to Unix epoch milliseconds
 * @param tp The time_point to convert
 * @return Milliseconds since the epoch
 */
int64_t toUnixMs(const TimePoint &tp);

/**
 * @brief Calendar day of a time_point in the viewer's local time zone
 * @param tp The time_point
 * @return Day key formatted as "YYYY-MM-DD"
 */
std::string localDayKey(const TimePoint &tp);

/**
 * @brief Check whether two time_points fall on the same local calendar day
 */
bool isSameLocalDay(const TimePoint &a, const TimePoint &b);

/**
 * @brief Format the label shown on a date separator (e.g., "December 22, 2024")
 */
std::string formatDateLabel(const TimePoint &tp);

/**
 * @brief Format the local wall-clock time shown in a message header (e.g., "15:30")
 */
std::string formatClock(const TimePoint &tp);

} // namespace TimeUtils

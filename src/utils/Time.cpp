#include "utils/Time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

namespace {

std::tm toLocalTm(const TimePoint &tp) {
    auto timeT = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};

#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif

    return tm;
}

std::string formatLocal(const TimePoint &tp, const char *format) {
    std::tm tm = toLocalTm(tp);
    std::ostringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

} // namespace

TimePoint fromUnixMs(int64_t ms) { return TimePoint(std::chrono::milliseconds(ms)); }

int64_t toUnixMs(const TimePoint &tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string localDayKey(const TimePoint &tp) { return formatLocal(tp, "%Y-%m-%d"); }

bool isSameLocalDay(const TimePoint &a, const TimePoint &b) {
    std::tm ta = toLocalTm(a);
    std::tm tb = toLocalTm(b);
    return ta.tm_year == tb.tm_year && ta.tm_mon == tb.tm_mon && ta.tm_mday == tb.tm_mday;
}

std::string formatDateLabel(const TimePoint &tp) { return formatLocal(tp, "%B %d, %Y"); }

std::string formatClock(const TimePoint &tp) { return formatLocal(tp, "%H:%M"); }

} // namespace TimeUtils

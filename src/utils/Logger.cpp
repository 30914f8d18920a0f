#include "utils/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Logger {

static std::mutex g_mutex;
static Level g_level = Level::INFO;
static Sink g_sink;

static const char *getName(Level level) {
    switch (level) {
    case Level::DEBUG:
        return "DEBUG";
    case Level::INFO:
        return "INFO";
    case Level::WARN:
        return "WARN";
    case Level::ERROR:
        return "ERROR";
    case Level::NONE:
        return "NONE";
    default:
        return "INFO";
    }
}

static const char *getColor(Level level) {
    switch (level) {
    case Level::DEBUG:
        return "\033[36m";
    case Level::WARN:
        return "\033[33m";
    case Level::ERROR:
        return "\033[31m";
    default:
        return "\033[37m";
    }
}

static constexpr const char *DIM = "\033[90m";
static constexpr const char *RESET = "\033[0m";

static std::string timestamp() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour << ":" << std::setw(2) << tm.tm_min << ":" << std::setw(2)
        << tm.tm_sec << "." << std::setw(3) << ms.count();
    return oss.str();
}

void setLevel(Level level) {
    std::scoped_lock lock(g_mutex);
    g_level = level;
}

Level getLevel() {
    std::scoped_lock lock(g_mutex);
    return g_level;
}

std::optional<Level> parseLevel(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return Level::DEBUG;
    if (lower == "info")
        return Level::INFO;
    if (lower == "warn" || lower == "warning")
        return Level::WARN;
    if (lower == "error")
        return Level::ERROR;
    if (lower == "none" || lower == "off")
        return Level::NONE;
    return std::nullopt;
}

void setSink(Sink sink) {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void debug(const std::string &message) { log(Level::DEBUG, "", message); }
void info(const std::string &message) { log(Level::INFO, "", message); }
void warn(const std::string &message) { log(Level::WARN, "", message); }
void error(const std::string &message) { log(Level::ERROR, "", message); }

void log(Level level, const std::string &tag, const std::string &message) {
    Sink sink;
    {
        std::scoped_lock lock(g_mutex);
        if (g_level == Level::NONE || level < g_level)
            return;
        sink = g_sink;
    }

    const std::string ts = timestamp();
    const std::string tagPart = tag.empty() ? "" : "[" + tag + "] ";
    const std::string levelPart = std::string("[") + getName(level) + "] ";

    if (sink) {
        sink(level, ts + " " + tagPart + levelPart + message);
        return;
    }

    std::ostringstream out;
    out << DIM << ts << " " << tagPart << RESET << getColor(level) << levelPart << message << RESET << "\n";

    // Warnings and errors go to stderr so they survive a redirected stdout.
    std::scoped_lock lock(g_mutex);
    std::ostream &stream = level >= Level::WARN ? std::cerr : std::cout;
    stream << out.str();
    stream.flush();
}

} // namespace Logger

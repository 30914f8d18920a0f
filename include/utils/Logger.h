#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#ifdef ERROR
#undef ERROR
#endif

namespace Logger {
enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, NONE = 4 };

/**
 * @brief Receives every line that passes the level filter, without color codes or newline
 */
using Sink = std::function<void(Level level, const std::string &line)>;

void setLevel(Level level);
Level getLevel();

/**
 * @brief Parse "debug", "info", "warn", "error" or "none" (case-insensitive)
 */
std::optional<Level> parseLevel(const std::string &name);

/**
 * @brief Route output to a sink instead of the console; an empty sink restores the console
 */
void setSink(Sink sink);

void debug(const std::string &message);
void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

/**
 * @brief Log with a component tag, rendered as "[tag]" before the level
 */
void log(Level level, const std::string &tag, const std::string &message);
} // namespace Logger

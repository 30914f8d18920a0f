#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "models/User.h"
#include "utils/Logger.h"

/**
 * @brief Tunables of the conversation feed, with the defaults used when no file is given
 *
 * Durations are read from the JSON file in milliseconds, pixel values as integers.
 */
struct Settings {
    std::chrono::milliseconds groupingWindow{5 * 60 * 1000}; ///< "groupingWindowMs"
    std::chrono::milliseconds typingTimeout{5000};           ///< "typingTimeoutMs"
    int overscan = 90;                                       ///< "overscan", items rendered beyond the viewport
    int pageSize = 60;                                       ///< "pageSize", posts per pagination request
    int bottomThreshold = 10;                                ///< "bottomThresholdPx"
    int compactBreakpoint = 600;                             ///< "compactBreakpointPx", narrower views stack files
    bool showJoinLeave = true;                               ///< "showJoinLeave"
    NameDisplay nameDisplay = NameDisplay::FullNameNickname; ///< "teammateNameDisplay"
    Logger::Level logLevel = Logger::Level::INFO;            ///< "logLevel"

    /**
     * @brief Typing signals are swept at half the timeout so staleness stays under 1.5x
     */
    std::chrono::milliseconds typingSweepInterval() const { return typingTimeout / 2; }

    /**
     * @brief Build settings from a JSON object, keeping defaults for missing or invalid keys
     * @param j JSON object
     * @return Settings instance
     */
    static Settings fromJson(const nlohmann::json &j);

    /**
     * @brief Read settings from a JSON file
     * @param path File path
     * @return Parsed settings, or defaults if the file is missing or unreadable
     */
    static Settings loadFromFile(const std::string &path);
};

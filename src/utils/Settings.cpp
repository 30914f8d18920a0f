#include "utils/Settings.h"

#include <filesystem>
#include <fstream>

#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {

template <class T> bool readKey(const nlohmann::json &j, const char *key, T &out) {
    if (!j.contains(key) || j[key].is_null()) {
        return false;
    }
    try {
        out = j[key].get<T>();
        return true;
    } catch (const nlohmann::json::exception &e) {
        Logger::warn(std::string("Settings: ignoring invalid value for '") + key + "': " + e.what());
        return false;
    }
}

void readPositiveMs(const nlohmann::json &j, const char *key, std::chrono::milliseconds &out) {
    int64_t value = 0;
    if (!readKey(j, key, value)) {
        return;
    }
    if (value <= 0) {
        Logger::warn(std::string("Settings: '") + key + "' must be positive, keeping default");
        return;
    }
    out = std::chrono::milliseconds(value);
}

void readNonNegative(const nlohmann::json &j, const char *key, int &out) {
    int value = 0;
    if (!readKey(j, key, value)) {
        return;
    }
    if (value < 0) {
        Logger::warn(std::string("Settings: '") + key + "' must not be negative, keeping default");
        return;
    }
    out = value;
}

} // namespace

Settings Settings::fromJson(const nlohmann::json &j) {
    Settings settings;
    if (!j.is_object()) {
        Logger::warn("Settings: expected a JSON object, using defaults");
        return settings;
    }

    readPositiveMs(j, "groupingWindowMs", settings.groupingWindow);
    readPositiveMs(j, "typingTimeoutMs", settings.typingTimeout);
    readNonNegative(j, "overscan", settings.overscan);
    readNonNegative(j, "bottomThresholdPx", settings.bottomThreshold);
    readNonNegative(j, "compactBreakpointPx", settings.compactBreakpoint);
    readKey(j, "showJoinLeave", settings.showJoinLeave);

    int pageSize = 0;
    if (readKey(j, "pageSize", pageSize)) {
        if (pageSize > 0) {
            settings.pageSize = pageSize;
        } else {
            Logger::warn("Settings: 'pageSize' must be positive, keeping default");
        }
    }

    std::string display;
    if (readKey(j, "teammateNameDisplay", display)) {
        auto parsed = parseNameDisplay(display);
        if (parsed.has_value()) {
            settings.nameDisplay = *parsed;
        } else {
            Logger::warn("Settings: unknown teammateNameDisplay '" + display + "'");
        }
    }

    std::string level;
    if (readKey(j, "logLevel", level)) {
        auto parsed = Logger::parseLevel(level);
        if (parsed.has_value()) {
            settings.logLevel = *parsed;
        } else {
            Logger::warn("Settings: unknown logLevel '" + level + "'");
        }
    }

    return settings;
}

Settings Settings::loadFromFile(const std::string &path) {
    if (path.empty() || !fs::exists(path)) {
        Logger::info("Settings: no settings file, using defaults");
        return Settings{};
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::warn("Settings: cannot open " + path + ", using defaults");
            return Settings{};
        }

        nlohmann::json data;
        file >> data;
        Logger::info("Settings: loaded " + path);
        return fromJson(data);
    } catch (const std::exception &e) {
        Logger::error("Settings: failed to parse " + path + ": " + e.what());
        return Settings{};
    }
}

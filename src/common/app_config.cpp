#include "common/app_config.hpp"
#include "common/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return "/tmp";
    }
    return home;
}

template <typename T>
void readKey(const json& j, const char* key, T& out) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

void requireNonNegative(const char* key, int value) {
    if (value < 0) {
        throw ConfigError(std::string("'") + key + "' must not be negative");
    }
}

} // namespace

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.resolvePaths();
    return config;
}

AppConfig AppConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
    return fromJson(j);
}

AppConfig AppConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    AppConfig config;
    readKey(j, "dataDir", config.dataDir);
    readKey(j, "databasePath", config.databasePath);
    readKey(j, "logPath", config.logPath);
    readKey(j, "playgroundDir", config.playgroundDir);
    readKey(j, "rsyncPath", config.rsyncPath);
    readKey(j, "rclonePath", config.rclonePath);
    readKey(j, "killGracePeriodMs", config.killGracePeriodMs);
    readKey(j, "logBufferLines", config.logBufferLines);
    readKey(j, "stallTimeoutSeconds", config.stallTimeoutSeconds);
    readKey(j, "runTimeoutSeconds", config.runTimeoutSeconds);
    readKey(j, "watchdogIntervalMs", config.watchdogIntervalMs);
    readKey(j, "retentionKeepLast", config.retentionKeepLast);

    std::string level;
    readKey(j, "logLevel", level);
    if (!level.empty()) {
        config.logLevel = Logger::parseLevel(level, config.logLevel);
    }

    requireNonNegative("killGracePeriodMs", config.killGracePeriodMs);
    requireNonNegative("stallTimeoutSeconds", config.stallTimeoutSeconds);
    requireNonNegative("runTimeoutSeconds", config.runTimeoutSeconds);
    requireNonNegative("retentionKeepLast", config.retentionKeepLast);
    if (config.logBufferLines <= 0) {
        throw ConfigError("'logBufferLines' must be positive");
    }
    if (config.watchdogIntervalMs <= 0) {
        throw ConfigError("'watchdogIntervalMs' must be positive");
    }
    if (config.rsyncPath.empty() || config.rclonePath.empty()) {
        throw ConfigError("transfer executable paths must not be empty");
    }

    config.resolvePaths();
    return config;
}

json AppConfig::toJson() const {
    return json{
        {"dataDir", dataDir},
        {"databasePath", databasePath},
        {"logPath", logPath},
        {"playgroundDir", playgroundDir},
        {"logLevel", Logger::levelToString(logLevel)},
        {"rsyncPath", rsyncPath},
        {"rclonePath", rclonePath},
        {"killGracePeriodMs", killGracePeriodMs},
        {"logBufferLines", logBufferLines},
        {"stallTimeoutSeconds", stallTimeoutSeconds},
        {"runTimeoutSeconds", runTimeoutSeconds},
        {"watchdogIntervalMs", watchdogIntervalMs},
        {"retentionKeepLast", retentionKeepLast}
    };
}

void AppConfig::resolvePaths() {
    const std::filesystem::path home = homeDirectory();
    if (dataDir.empty()) {
        dataDir = (home / ".local" / "share" / "amber").string();
    }
    if (databasePath.empty()) {
        databasePath = (std::filesystem::path(dataDir) / "index.db").string();
    }
    if (logPath.empty()) {
        logPath = (std::filesystem::path(dataDir) / "amber.log").string();
    }
    if (playgroundDir.empty()) {
        playgroundDir = (home / ".amber-dev").string();
    }
}

#pragma once

#include "common/logger.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Runtime configuration. Every key of the JSON file is optional.
struct AppConfig {
    std::string dataDir;         // Holds the history database and the log file
    std::string databasePath;    // Defaults to <dataDir>/index.db
    std::string logPath;         // Defaults to <dataDir>/amber.log
    std::string playgroundDir;   // Dev harness sandbox, defaults to $HOME/.amber-dev
    LogLevel logLevel{LogLevel::INFO};

    std::string rsyncPath{"rsync"};
    std::string rclonePath{"rclone"};

    int killGracePeriodMs{5000};
    int logBufferLines{500};
    int stallTimeoutSeconds{0};  // 0 disables the stall policy
    int runTimeoutSeconds{0};    // 0 disables the max runtime policy
    int watchdogIntervalMs{1000};
    int retentionKeepLast{0};    // 0 keeps every snapshot

    static AppConfig defaults();
    // Throws ConfigError on unreadable files, bad JSON or wrongly typed keys.
    static AppConfig loadFromFile(const std::string& path);
    static AppConfig fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

private:
    void resolvePaths();
};

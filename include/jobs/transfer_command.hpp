#pragma once

#include "common/sync_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct TransferCommand {
    std::string tool;                       // "rsync" or "rclone", for messages
    std::vector<std::string> argv;
    std::string source;
    std::string destination;                // where this run writes
    std::optional<std::string> linkDest;    // previous TIME_MACHINE snapshot
    std::optional<std::string> snapshotFolder;

    std::string commandLine() const;
};

class TransferCommandBuilder {
public:
    TransferCommandBuilder(const std::string& rsyncPath, const std::string& rclonePath);

    // Reads the destination to resolve --link-dest for TIME_MACHINE jobs but never writes.
    TransferCommand build(const Job& job, int64_t startedAtMillis) const;

    // Local time "YYYY-MM-DD-HHMMSS"
    static std::string snapshotFolderName(int64_t millis);
    static bool isSnapshotFolderName(const std::string& name);

    // Target of <destination>/latest, else the newest snapshot folder.
    static std::optional<std::string> findLatestSnapshot(const std::string& destination);

    // Repoints <destination>/latest at folderName. Returns false and sets error on failure.
    static bool updateLatestLink(const std::string& destination, const std::string& folderName, std::string& error);

    static bool isRemoteDestination(const std::string& destination);

private:
    std::vector<std::string> rsyncArgs(const Job& job, const std::string& destination,
                                       const std::optional<std::string>& linkDest) const;
    std::vector<std::string> rcloneArgs(const Job& job) const;

    std::string rsyncPath_;
    std::string rclonePath_;
};

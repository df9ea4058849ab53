#pragma once

#include "common/sync_types.hpp"
#include "history/sqlite_database.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct SnapshotMatch {
    Snapshot snapshot;
    std::vector<std::string> paths;
};

struct HistoryStats {
    uint64_t snapshotCount{0};
    uint64_t fileCount{0};
    uint64_t totalSizeBytes{0};
    uint64_t indexEntryCount{0};
    uint64_t storageSizeBytes{0};
};

void to_json(nlohmann::json& j, const SnapshotMatch& match);
void to_json(nlohmann::json& j, const HistoryStats& stats);

// Append-only history of TIME_MACHINE snapshots in SQLite, with an FTS5
// trigram index over file paths. Commits go through a dedicated write
// connection; queries use a second connection and see whole commits only.
class SnapshotStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    // Creates or migrates the database. Throws StoreError.
    explicit SnapshotStore(const std::string& databasePath);
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    // Throws InvalidCommitError unless the run is a SUCCESS of a TIME_MACHINE job.
    Snapshot commit(const JobRun& run, const FileIndex& fileIndex, const std::string& rootPath);

    // Newest first. The range is inclusive.
    std::vector<Snapshot> query(const std::string& jobId, const std::optional<TimeRange>& range = std::nullopt);
    std::optional<Snapshot> getSnapshot(int64_t snapshotId);

    // Case-insensitive substring match over paths, grouped per snapshot in query() order.
    // The limit caps the number of matching paths.
    std::vector<SnapshotMatch> searchPaths(const std::string& pattern,
                                           const std::optional<std::string>& jobId = std::nullopt,
                                           std::optional<size_t> limit = std::nullopt);

    HistoryStats stats();
    FileIndex snapshotFiles(int64_t snapshotId);

    // Deletes all but the newest keepLast snapshots of the job. Returns the number removed.
    size_t pruneRetention(const std::string& jobId, size_t keepLast);

    void rebuildIndex();
    bool verifyIndex();
    void compact();

    const std::string& databasePath() const { return databasePath_; }

    // Hex SHA-256 over the sorted, newline-terminated path set.
    static std::string computeDigest(const FileIndex& fileIndex);

private:
    void migrate();
    Snapshot readSnapshot(SqliteStatement& stmt, int firstColumn = 0) const;

    std::string databasePath_;
    std::unique_ptr<SqliteDatabase> writer_;
    std::unique_ptr<SqliteDatabase> reader_;
    std::mutex writeMutex_;
    std::mutex readMutex_;
};

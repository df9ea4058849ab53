#include "history/snapshot_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <map>
#include <openssl/evp.h>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* const SNAPSHOT_COLUMNS =
    "s.id, s.job_id, s.run_id, s.created_at, s.file_count, s.total_size, s.root_path, s.index_digest";

const char* const SCHEMA_V1 = R"SQL(
CREATE TABLE IF NOT EXISTS snapshots (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    job_id TEXT NOT NULL,
    run_id TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    file_count INTEGER NOT NULL,
    total_size INTEGER NOT NULL,
    root_path TEXT NOT NULL,
    index_digest TEXT NOT NULL,
    UNIQUE (job_id, created_at)
);

CREATE TABLE IF NOT EXISTS files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    snapshot_id INTEGER NOT NULL REFERENCES snapshots(id) ON DELETE CASCADE,
    path TEXT NOT NULL,
    name TEXT NOT NULL,
    parent_path TEXT NOT NULL,
    size INTEGER NOT NULL,
    UNIQUE (snapshot_id, path)
);

CREATE INDEX IF NOT EXISTS idx_snapshots_job_created ON snapshots(job_id, created_at DESC);
CREATE INDEX IF NOT EXISTS idx_files_snapshot_parent ON files(snapshot_id, parent_path);
CREATE INDEX IF NOT EXISTS idx_files_name ON files(name);

CREATE VIRTUAL TABLE IF NOT EXISTS files_fts USING fts5(
    path,
    name,
    content = 'files',
    content_rowid = 'id',
    tokenize = 'trigram'
);

CREATE TRIGGER IF NOT EXISTS files_ai AFTER INSERT ON files BEGIN
    INSERT INTO files_fts(rowid, path, name) VALUES (new.id, new.path, new.name);
END;

CREATE TRIGGER IF NOT EXISTS files_ad AFTER DELETE ON files BEGIN
    INSERT INTO files_fts(files_fts, rowid, path, name) VALUES ('delete', old.id, old.path, old.name);
END;

CREATE TRIGGER IF NOT EXISTS snapshots_immutable BEFORE UPDATE ON snapshots BEGIN
    SELECT RAISE(ABORT, 'snapshots are immutable');
END;

CREATE TRIGGER IF NOT EXISTS files_immutable BEFORE UPDATE ON files BEGIN
    SELECT RAISE(ABORT, 'snapshot files are immutable');
END;
)SQL";

std::string normalizePath(const std::string& path) {
    if (path.empty() || path[0] == '/') {
        return path;
    }
    return "/" + path;
}

std::string fileName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string parentPath(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

size_t codePointCount(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string ftsPhrase(const std::string& pattern) {
    std::string phrase = "\"";
    for (char c : pattern) {
        if (c == '"') {
            phrase += "\"\"";
        } else {
            phrase += c;
        }
    }
    return phrase + "\"";
}

std::string likePattern(const std::string& pattern) {
    std::string like = "%";
    for (char c : pattern) {
        if (c == '%' || c == '_' || c == '\\') {
            like += '\\';
        }
        like += c;
    }
    return like + "%";
}

} // namespace

void to_json(json& j, const SnapshotMatch& match) {
    j = json{
        {"snapshot", match.snapshot},
        {"paths", match.paths}
    };
}

void to_json(json& j, const HistoryStats& stats) {
    j = json{
        {"snapshotCount", stats.snapshotCount},
        {"fileCount", stats.fileCount},
        {"totalSizeBytes", stats.totalSizeBytes},
        {"indexEntryCount", stats.indexEntryCount},
        {"storageSizeBytes", stats.storageSizeBytes}
    };
}

SnapshotStore::SnapshotStore(const std::string& databasePath)
    : databasePath_(databasePath) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(databasePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("cannot create " + parent.string() + ": " + ec.message());
        }
    }

    writer_ = std::make_unique<SqliteDatabase>(databasePath, SqliteDatabase::Mode::READ_WRITE);
    writer_->exec("PRAGMA journal_mode = WAL");
    writer_->exec("PRAGMA foreign_keys = ON");
    writer_->exec("PRAGMA synchronous = NORMAL");
    migrate();

    reader_ = std::make_unique<SqliteDatabase>(databasePath, SqliteDatabase::Mode::READ_ONLY);
    Logger::info("Snapshot history opened at " + databasePath);
}

SnapshotStore::~SnapshotStore() {
    reader_.reset();
    writer_.reset();
}

void SnapshotStore::migrate() {
    int version = writer_->userVersion();
    if (version > SCHEMA_VERSION) {
        throw StoreError("database schema version " + std::to_string(version) +
                         " is newer than supported version " + std::to_string(SCHEMA_VERSION));
    }
    if (version == SCHEMA_VERSION) {
        return;
    }

    Logger::info("Migrating snapshot history schema from version " + std::to_string(version) +
                 " to " + std::to_string(SCHEMA_VERSION));
    SqliteDatabase::Transaction tx(*writer_);
    if (version < 1) {
        writer_->exec(SCHEMA_V1);
    }
    writer_->setUserVersion(SCHEMA_VERSION);
    tx.commit();
}

std::string SnapshotStore::computeDigest(const FileIndex& fileIndex) {
    std::vector<std::string> paths;
    paths.reserve(fileIndex.size());
    for (const auto& file : fileIndex) {
        paths.push_back(file.path);
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw StoreError("failed to create digest context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw StoreError("failed to initialize SHA-256");
    }
    for (const auto& path : paths) {
        if (EVP_DigestUpdate(ctx, path.data(), path.size()) != 1 ||
            EVP_DigestUpdate(ctx, "\n", 1) != 1) {
            EVP_MD_CTX_free(ctx);
            throw StoreError("failed to update SHA-256");
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw StoreError("failed to finalize SHA-256");
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

Snapshot SnapshotStore::commit(const JobRun& run, const FileIndex& fileIndex, const std::string& rootPath) {
    if (run.status != JobStatus::SUCCESS || run.mode != SyncMode::TIME_MACHINE) {
        std::string message = "run " + run.runId + " of job " + run.jobId + " is " + toString(run.status) +
                              " in mode " + toString(run.mode) + "; only successful TIME_MACHINE runs are recorded";
        Logger::error("Invalid snapshot commit: " + message);
        throw InvalidCommitError(message);
    }
    if (run.jobId.empty()) {
        Logger::error("Invalid snapshot commit: empty job id");
        throw InvalidCommitError("empty job id");
    }

    // First occurrence of a path wins.
    std::map<std::string, uint64_t> unique;
    for (const auto& file : fileIndex) {
        std::string path = normalizePath(file.path);
        if (path.empty() || path == "/") {
            continue;
        }
        unique.emplace(path, file.size);
    }

    FileIndex files;
    files.reserve(unique.size());
    uint64_t totalSize = 0;
    for (const auto& pair : unique) {
        files.push_back(IndexedFile{pair.first, pair.second});
        totalSize += pair.second;
    }

    Snapshot snapshot;
    snapshot.jobId = run.jobId;
    snapshot.runId = run.runId;
    snapshot.fileCount = files.size();
    snapshot.totalSizeBytes = totalSize;
    snapshot.rootPath = rootPath;
    snapshot.indexDigest = computeDigest(files);

    std::lock_guard<std::mutex> lock(writeMutex_);
    SqliteDatabase::Transaction tx(*writer_);

    int64_t createdAt = run.endedAt.value_or(nowMillis());
    {
        auto latest = writer_->prepare("SELECT MAX(created_at) FROM snapshots WHERE job_id = ?1");
        latest.bind(1, run.jobId);
        if (latest.step() && !latest.columnIsNull(0)) {
            createdAt = std::max(createdAt, latest.columnInt64(0) + 1);
        }
    }
    snapshot.createdAt = createdAt;

    auto insertSnapshot = writer_->prepare(
        "INSERT INTO snapshots (job_id, run_id, created_at, file_count, total_size, root_path, index_digest) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    insertSnapshot.bind(1, snapshot.jobId)
        .bind(2, snapshot.runId)
        .bind(3, snapshot.createdAt)
        .bind(4, static_cast<int64_t>(snapshot.fileCount))
        .bind(5, static_cast<int64_t>(snapshot.totalSizeBytes))
        .bind(6, snapshot.rootPath)
        .bind(7, snapshot.indexDigest);
    insertSnapshot.step();
    snapshot.snapshotId = writer_->lastInsertRowId();

    auto insertFile = writer_->prepare(
        "INSERT INTO files (snapshot_id, path, name, parent_path, size) VALUES (?1, ?2, ?3, ?4, ?5)");
    for (const auto& file : files) {
        insertFile.reset();
        insertFile.bind(1, snapshot.snapshotId)
            .bind(2, file.path)
            .bind(3, fileName(file.path))
            .bind(4, parentPath(file.path))
            .bind(5, static_cast<int64_t>(file.size));
        insertFile.step();
    }

    tx.commit();
    Logger::info("Committed snapshot " + std::to_string(snapshot.snapshotId) + " for job " + snapshot.jobId +
                 " (" + std::to_string(snapshot.fileCount) + " files)");
    return snapshot;
}

Snapshot SnapshotStore::readSnapshot(SqliteStatement& stmt, int firstColumn) const {
    Snapshot snapshot;
    snapshot.snapshotId = stmt.columnInt64(firstColumn);
    snapshot.jobId = stmt.columnText(firstColumn + 1);
    snapshot.runId = stmt.columnText(firstColumn + 2);
    snapshot.createdAt = stmt.columnInt64(firstColumn + 3);
    snapshot.fileCount = static_cast<uint64_t>(stmt.columnInt64(firstColumn + 4));
    snapshot.totalSizeBytes = static_cast<uint64_t>(stmt.columnInt64(firstColumn + 5));
    snapshot.rootPath = stmt.columnText(firstColumn + 6);
    snapshot.indexDigest = stmt.columnText(firstColumn + 7);
    return snapshot;
}

std::vector<Snapshot> SnapshotStore::query(const std::string& jobId, const std::optional<TimeRange>& range) {
    std::string sql = std::string("SELECT ") + SNAPSHOT_COLUMNS + " FROM snapshots s WHERE s.job_id = ?1";
    if (range) {
        sql += " AND s.created_at BETWEEN ?2 AND ?3";
    }
    sql += " ORDER BY s.created_at DESC, s.id DESC";

    std::lock_guard<std::mutex> lock(readMutex_);
    auto stmt = reader_->prepare(sql);
    stmt.bind(1, jobId);
    if (range) {
        stmt.bind(2, range->from).bind(3, range->to);
    }

    std::vector<Snapshot> snapshots;
    while (stmt.step()) {
        snapshots.push_back(readSnapshot(stmt));
    }
    return snapshots;
}

std::optional<Snapshot> SnapshotStore::getSnapshot(int64_t snapshotId) {
    std::lock_guard<std::mutex> lock(readMutex_);
    auto stmt = reader_->prepare(std::string("SELECT ") + SNAPSHOT_COLUMNS + " FROM snapshots s WHERE s.id = ?1");
    stmt.bind(1, snapshotId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readSnapshot(stmt);
}

std::vector<SnapshotMatch> SnapshotStore::searchPaths(const std::string& pattern,
                                                      const std::optional<std::string>& jobId,
                                                      std::optional<size_t> limit) {
    std::vector<SnapshotMatch> results;
    if (pattern.empty() || (limit && *limit == 0)) {
        return results;
    }

    // The trigram tokenizer needs at least three characters for MATCH.
    const bool useMatch = codePointCount(pattern) >= 3;
    std::string sql = std::string("SELECT ") + SNAPSHOT_COLUMNS + ", f.path "
        "FROM files_fts "
        "JOIN files f ON f.id = files_fts.rowid "
        "JOIN snapshots s ON s.id = f.snapshot_id WHERE ";
    sql += useMatch ? "files_fts MATCH ?1" : "files_fts.path LIKE ?1 ESCAPE '\\'";
    if (jobId) {
        sql += " AND s.job_id = ?2";
    }
    sql += " ORDER BY s.created_at DESC, s.id DESC, f.path ASC LIMIT ?3";

    std::lock_guard<std::mutex> lock(readMutex_);
    auto stmt = reader_->prepare(sql);
    stmt.bind(1, useMatch ? ftsPhrase(pattern) : likePattern(pattern));
    if (jobId) {
        stmt.bind(2, *jobId);
    }
    stmt.bind(3, limit ? static_cast<int64_t>(*limit) : int64_t(-1));

    while (stmt.step()) {
        int64_t snapshotId = stmt.columnInt64(0);
        if (results.empty() || results.back().snapshot.snapshotId != snapshotId) {
            results.push_back(SnapshotMatch{readSnapshot(stmt), {}});
        }
        results.back().paths.push_back(stmt.columnText(8));
    }
    return results;
}

HistoryStats SnapshotStore::stats() {
    std::lock_guard<std::mutex> lock(readMutex_);
    HistoryStats stats;
    stats.snapshotCount = static_cast<uint64_t>(reader_->queryInt64("SELECT COUNT(*) FROM snapshots").value_or(0));
    stats.fileCount = static_cast<uint64_t>(reader_->queryInt64("SELECT COUNT(*) FROM files").value_or(0));
    stats.totalSizeBytes = static_cast<uint64_t>(
        reader_->queryInt64("SELECT SUM(total_size) FROM snapshots").value_or(0));
    stats.indexEntryCount = static_cast<uint64_t>(
        reader_->queryInt64("SELECT COUNT(*) FROM files_fts_docsize").value_or(0));
    stats.storageSizeBytes = static_cast<uint64_t>(
        reader_->queryInt64("SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size()")
            .value_or(0));
    return stats;
}

FileIndex SnapshotStore::snapshotFiles(int64_t snapshotId) {
    std::lock_guard<std::mutex> lock(readMutex_);
    auto stmt = reader_->prepare("SELECT path, size FROM files WHERE snapshot_id = ?1 ORDER BY path");
    stmt.bind(1, snapshotId);

    FileIndex files;
    while (stmt.step()) {
        files.push_back(IndexedFile{stmt.columnText(0), static_cast<uint64_t>(stmt.columnInt64(1))});
    }
    return files;
}

size_t SnapshotStore::pruneRetention(const std::string& jobId, size_t keepLast) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    SqliteDatabase::Transaction tx(*writer_);

    std::vector<int64_t> doomed;
    {
        auto select = writer_->prepare(
            "SELECT id FROM snapshots WHERE job_id = ?1 ORDER BY created_at DESC, id DESC LIMIT -1 OFFSET ?2");
        select.bind(1, jobId).bind(2, static_cast<int64_t>(keepLast));
        while (select.step()) {
            doomed.push_back(select.columnInt64(0));
        }
    }

    auto deleteFiles = writer_->prepare("DELETE FROM files WHERE snapshot_id = ?1");
    auto deleteSnapshot = writer_->prepare("DELETE FROM snapshots WHERE id = ?1");
    for (int64_t id : doomed) {
        deleteFiles.reset();
        deleteFiles.bind(1, id);
        deleteFiles.step();
        deleteSnapshot.reset();
        deleteSnapshot.bind(1, id);
        deleteSnapshot.step();
    }
    tx.commit();

    if (!doomed.empty()) {
        Logger::info("Pruned " + std::to_string(doomed.size()) + " snapshots of job " + jobId);
    }
    return doomed.size();
}

void SnapshotStore::rebuildIndex() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    Logger::info("Rebuilding full-text index");
    writer_->exec("INSERT INTO files_fts(files_fts) VALUES ('rebuild')");
}

bool SnapshotStore::verifyIndex() {
    std::lock_guard<std::mutex> lock(writeMutex_);

    try {
        writer_->exec("INSERT INTO files_fts(files_fts) VALUES ('integrity-check')");
    } catch (const StoreError& e) {
        Logger::warning(std::string("Full-text index integrity check failed: ") + e.what());
        return false;
    }

    int64_t files = writer_->queryInt64("SELECT COUNT(*) FROM files").value_or(0);
    int64_t entries = writer_->queryInt64("SELECT COUNT(*) FROM files_fts_docsize").value_or(0);
    int64_t missing = writer_->queryInt64(
        "SELECT COUNT(*) FROM files f WHERE NOT EXISTS "
        "(SELECT 1 FROM files_fts_docsize d WHERE d.id = f.id)").value_or(0);
    if (files != entries || missing != 0) {
        Logger::warning("Full-text index has " + std::to_string(entries) + " entries for " +
                        std::to_string(files) + " files (" + std::to_string(missing) + " missing)");
        return false;
    }

    std::vector<std::pair<int64_t, std::pair<int64_t, std::string>>> expected;
    {
        auto stmt = writer_->prepare("SELECT id, file_count, index_digest FROM snapshots ORDER BY id");
        while (stmt.step()) {
            expected.push_back({stmt.columnInt64(0), {stmt.columnInt64(1), stmt.columnText(2)}});
        }
    }

    auto filesStmt = writer_->prepare("SELECT path FROM files WHERE snapshot_id = ?1");
    for (const auto& entry : expected) {
        FileIndex index;
        filesStmt.reset();
        filesStmt.bind(1, entry.first);
        while (filesStmt.step()) {
            index.push_back(IndexedFile{filesStmt.columnText(0), 0});
        }
        if (static_cast<int64_t>(index.size()) != entry.second.first ||
            computeDigest(index) != entry.second.second) {
            Logger::warning("Snapshot " + std::to_string(entry.first) + " no longer matches its index digest");
            return false;
        }
    }
    return true;
}

void SnapshotStore::compact() {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    std::lock_guard<std::mutex> readLock(readMutex_);
    writer_->exec("PRAGMA wal_checkpoint(TRUNCATE)");
    writer_->exec("VACUUM");
    Logger::info("Compacted " + databasePath_);
}

#include "dev/dev_harness.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "history/snapshot_scanner.hpp"
#include "history/snapshot_store.hpp"
#include "jobs/transfer_command.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* const DevHarness::JOB_ID = "dev-backup";
const char* const DevHarness::JOB_NAME = "Dev Backup";

namespace {

constexpr int64_t HOUR_MS = 3600 * 1000;

const char* const DIRECTORIES[] = {
    "src/components", "src/hooks", "src/utils", "src/api", "docs", "docs/guides",
    "config", "scripts", "assets/images", "data/exports", "tests/unit", "tests/e2e"
};

const char* const STEMS[] = {
    "button", "modal", "sidebar", "terminal", "history", "snapshot", "settings",
    "schedule", "progress", "index", "client", "server", "report", "backup"
};

const char* const EXTENSIONS[] = {
    ".tsx", ".ts", ".py", ".css", ".sql", ".md", ".json", ".yaml", ".toml", ".sh", ".csv", ".bin"
};

template <typename T, size_t N>
const T& pick(const T (&items)[N], std::mt19937& rng) {
    std::uniform_int_distribution<size_t> dist(0, N - 1);
    return items[dist(rng)];
}

DevBenchmarkResult bench(const std::string& name, size_t iterations, const std::function<void()>& fn) {
    DevBenchmarkResult result;
    result.operation = name;
    result.iterations = iterations;
    result.minMs = std::numeric_limits<double>::max();

    for (size_t i = 0; i < iterations; ++i) {
        auto begin = std::chrono::steady_clock::now();
        fn();
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - begin).count();
        result.totalMs += ms;
        result.minMs = std::min(result.minMs, ms);
        result.maxMs = std::max(result.maxMs, ms);
    }
    if (iterations == 0) {
        result.minMs = 0.0;
    } else {
        result.avgMs = result.totalMs / static_cast<double>(iterations);
    }
    return result;
}

} // namespace

void to_json(json& j, const DevSeedResult& result) {
    j = json{
        {"jobsCreated", result.jobsCreated},
        {"snapshotsCreated", result.snapshotsCreated},
        {"filesCreated", result.filesCreated},
        {"totalSizeBytes", result.totalSizeBytes},
        {"durationMs", result.durationMs}
    };
}

void to_json(json& j, const DevChurnResult& result) {
    j = json{{"added", result.added}, {"modified", result.modified}, {"deleted", result.deleted}};
}

void to_json(json& j, const DevBenchmarkResult& result) {
    j = json{
        {"operation", result.operation},
        {"iterations", result.iterations},
        {"avgMs", result.avgMs},
        {"minMs", result.minMs},
        {"maxMs", result.maxMs},
        {"totalMs", result.totalMs}
    };
}

void to_json(json& j, const DevDbStats& stats) {
    j = json{
        {"snapshotCount", stats.snapshotCount},
        {"fileCount", stats.fileCount},
        {"totalSizeBytes", stats.totalSizeBytes},
        {"ftsIndexEntries", stats.ftsIndexEntries},
        {"dbSizeBytes", stats.dbSizeBytes}
    };
}

DevHarness::DevHarness(std::shared_ptr<SnapshotStore> store, const DevHarnessOptions& options)
    : store_(store)
    , options_(options)
    , rng_(options.randomSeed) {
    if (!store_) {
        throw std::invalid_argument("DevHarness requires a snapshot store");
    }
    if (options_.playgroundDir.empty()) {
        throw ValidationError("dev playground directory is not configured");
    }
}

std::string DevHarness::sourceDir() const {
    return (fs::path(options_.playgroundDir) / "source").string();
}

std::string DevHarness::backupDir() const {
    return (fs::path(options_.playgroundDir) / "backup").string();
}

bool DevHarness::isSeeded() {
    return !store_->query(JOB_ID).empty();
}

void DevHarness::writeFile(const std::string& relativePath, size_t size) {
    fs::path path = fs::path(sourceDir()) / relativePath;
    fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    std::uniform_int_distribution<int> byte('a', 'z');
    std::string content(size, 'a');
    for (auto& c : content) {
        c = static_cast<char>(byte(rng_));
    }
    out << content;
}

size_t DevHarness::createSourceTree() {
    std::uniform_int_distribution<size_t> sizeDist(64, 8 * 1024);
    size_t created = 0;

    // Every directory gets a README so "readme" searches always hit.
    for (const char* dir : DIRECTORIES) {
        writeFile(std::string(dir) + "/README.md", sizeDist(rng_));
        ++created;
    }
    for (size_t i = 0; created < options_.seedFileCount; ++i) {
        std::string name = std::string(pick(STEMS, rng_)) + "_" + std::to_string(i) + pick(EXTENSIONS, rng_);
        writeFile(std::string(pick(DIRECTORIES, rng_)) + "/" + name, sizeDist(rng_));
        ++created;
    }
    return created;
}

Snapshot DevHarness::commitSourceSnapshot(int64_t createdAt) {
    SnapshotScanner scanner;
    FileIndex files;
    if (!scanner.scan(sourceDir(), files)) {
        throw StoreError("cannot scan dev source: " + scanner.getLastError());
    }

    JobRun run;
    run.jobId = JOB_ID;
    run.runId = "dev-" + std::to_string(createdAt);
    run.mode = SyncMode::TIME_MACHINE;
    run.status = JobStatus::SUCCESS;
    run.startedAt = createdAt - 1000;
    run.endedAt = createdAt;

    std::string folder = TransferCommandBuilder::snapshotFolderName(createdAt);
    return store_->commit(run, files, (fs::path(backupDir()) / folder).string());
}

DevSeedResult DevHarness::seed() {
    DevSeedResult result;
    if (isSeeded()) {
        Logger::info("Dev data already seeded");
        return result;
    }

    auto begin = std::chrono::steady_clock::now();
    std::error_code ec;
    fs::remove_all(sourceDir(), ec);
    fs::create_directories(backupDir(), ec);
    if (ec) {
        throw StoreError("cannot create " + backupDir() + ": " + ec.message());
    }

    result.filesCreated = createSourceTree();
    result.jobsCreated = 1;

    int64_t now = nowMillis();
    for (size_t i = 0; i < options_.seedSnapshots; ++i) {
        if (i > 0) {
            churnSource();
        }
        int64_t createdAt = now - static_cast<int64_t>(options_.seedSnapshots - i) * HOUR_MS;
        Snapshot snapshot = commitSourceSnapshot(createdAt);
        result.snapshotsCreated++;
        result.totalSizeBytes += snapshot.totalSizeBytes;
    }

    result.durationMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin).count());
    Logger::info("Seeded " + std::to_string(result.snapshotsCreated) + " dev snapshots with " +
                 std::to_string(result.filesCreated) + " files");
    return result;
}

DevChurnResult DevHarness::churnSource() {
    DevChurnResult result;
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(sourceDir(), ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    std::shuffle(files.begin(), files.end(), rng_);

    size_t deletable = files.size() > options_.churnMinFiles ? files.size() - options_.churnMinFiles : 0;
    size_t toDelete = std::min(options_.churnDelete, deletable);
    for (size_t i = 0; i < toDelete; ++i) {
        if (fs::remove(files[i], ec)) {
            result.deleted++;
        }
    }

    std::uniform_int_distribution<size_t> sizeDist(64, 8 * 1024);
    size_t toModify = std::min(options_.churnModify, files.size() - toDelete);
    for (size_t i = toDelete; i < toDelete + toModify; ++i) {
        std::ofstream out(files[i], std::ios::binary | std::ios::app);
        if (out.is_open()) {
            out << "\n// modified " << churnCounter_ << "\n";
            result.modified++;
        }
    }

    for (size_t i = 0; i < options_.churnAdd; ++i) {
        ++churnCounter_;
        std::string name = "churn/added_" + std::to_string(nowMillis()) + "_" + std::to_string(churnCounter_) + ".ts";
        writeFile(name, sizeDist(rng_));
        result.added++;
    }
    return result;
}

DevChurnResult DevHarness::simulateChurn() {
    if (!isSeeded() || !fs::is_directory(sourceDir())) {
        throw ValidationError("dev data is not seeded");
    }
    DevChurnResult result = churnSource();
    commitSourceSnapshot(nowMillis());
    Logger::info("Dev churn: +" + std::to_string(result.added) + " ~" + std::to_string(result.modified) +
                 " -" + std::to_string(result.deleted));
    return result;
}

std::vector<std::string> DevHarness::benchmarkNames() {
    return {"list_snapshots", "directory_contents", "fts_search", "snapshot_stats"};
}

DevBenchmarkResult DevHarness::benchmarkOperation(const std::string& name) {
    std::vector<Snapshot> snapshots = store_->query(JOB_ID);
    if (snapshots.empty()) {
        throw ValidationError("dev data is not seeded");
    }
    const int64_t latestId = snapshots.front().snapshotId;
    const size_t n = options_.benchmarkIterations;

    if (name == "list_snapshots") {
        return bench(name, n, [this] { store_->query(JOB_ID); });
    }
    if (name == "directory_contents") {
        return bench(name, n, [this, latestId] { store_->snapshotFiles(latestId); });
    }
    if (name == "fts_search") {
        return bench(name, n, [this] { store_->searchPaths("readme", std::string(JOB_ID)); });
    }
    if (name == "snapshot_stats") {
        return bench(name, n, [this] { store_->stats(); });
    }
    throw ValidationError("unknown benchmark '" + name + "'");
}

std::vector<DevBenchmarkResult> DevHarness::benchmarkAll() {
    std::vector<DevBenchmarkResult> results;
    for (const auto& name : benchmarkNames()) {
        results.push_back(benchmarkOperation(name));
    }
    return results;
}

DevDbStats DevHarness::getDbStats() {
    HistoryStats stats = store_->stats();
    DevDbStats result;
    result.snapshotCount = stats.snapshotCount;
    result.fileCount = stats.fileCount;
    result.totalSizeBytes = stats.totalSizeBytes;
    result.ftsIndexEntries = stats.indexEntryCount;
    result.dbSizeBytes = stats.storageSizeBytes;
    return result;
}

void DevHarness::clear() {
    size_t removed = store_->pruneRetention(JOB_ID, 0);

    std::error_code ec;
    fs::remove_all(sourceDir(), ec);
    if (ec) {
        Logger::warning("Cannot remove " + sourceDir() + ": " + ec.message());
    }
    fs::remove_all(backupDir(), ec);
    if (ec) {
        Logger::warning("Cannot remove " + backupDir() + ": " + ec.message());
    }
    Logger::info("Cleared dev data (" + std::to_string(removed) + " snapshots)");
}

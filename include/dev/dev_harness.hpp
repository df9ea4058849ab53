#pragma once

#include "common/sync_types.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class SnapshotStore;

struct DevSeedResult {
    uint64_t jobsCreated{0};
    uint64_t snapshotsCreated{0};
    uint64_t filesCreated{0};
    uint64_t totalSizeBytes{0};
    uint64_t durationMs{0};
};

struct DevChurnResult {
    uint64_t added{0};
    uint64_t modified{0};
    uint64_t deleted{0};
};

struct DevBenchmarkResult {
    std::string operation;
    uint64_t iterations{0};
    double avgMs{0.0};
    double minMs{0.0};
    double maxMs{0.0};
    double totalMs{0.0};
};

struct DevDbStats {
    uint64_t snapshotCount{0};
    uint64_t fileCount{0};
    uint64_t totalSizeBytes{0};
    uint64_t ftsIndexEntries{0};
    uint64_t dbSizeBytes{0};
};

struct DevHarnessOptions {
    std::string playgroundDir;
    size_t seedFileCount{2000};
    size_t seedSnapshots{3};
    size_t churnAdd{200};
    size_t churnModify{100};
    size_t churnDelete{50};
    size_t churnMinFiles{100};
    size_t benchmarkIterations{100};
    uint32_t randomSeed{42};
};

void to_json(nlohmann::json& j, const DevSeedResult& result);
void to_json(nlohmann::json& j, const DevChurnResult& result);
void to_json(nlohmann::json& j, const DevBenchmarkResult& result);
void to_json(nlohmann::json& j, const DevDbStats& stats);

// Populates a playground source tree and the history store with a
// deterministic dev job, and measures the store's hot queries.
class DevHarness {
public:
    static const char* const JOB_ID;
    static const char* const JOB_NAME;

    DevHarness(std::shared_ptr<SnapshotStore> store, const DevHarnessOptions& options);

    bool isSeeded();

    // Returns all zeros when the dev job already has history.
    DevSeedResult seed();

    // Adds, modifies and deletes files in the playground source, then records
    // the new state as a snapshot. Throws ValidationError before seed().
    DevChurnResult simulateChurn();

    // One of benchmarkNames(). Throws ValidationError for unknown names or before seed().
    DevBenchmarkResult benchmarkOperation(const std::string& name);
    std::vector<DevBenchmarkResult> benchmarkAll();
    static std::vector<std::string> benchmarkNames();

    DevDbStats getDbStats();

    // Removes the dev job's history and the playground folders.
    void clear();

    std::string sourceDir() const;
    std::string backupDir() const;

private:
    size_t createSourceTree();
    DevChurnResult churnSource();
    Snapshot commitSourceSnapshot(int64_t createdAt);
    void writeFile(const std::string& relativePath, size_t size);

    std::shared_ptr<SnapshotStore> store_;
    DevHarnessOptions options_;
    std::mt19937 rng_;
    uint64_t churnCounter_{0};
};

#pragma once

#include "common/app_config.hpp"
#include "common/event_bus.hpp"
#include "common/sync_types.hpp"
#include "dev/dev_harness.hpp"
#include "history/snapshot_store.hpp"
#include "jobs/job_registry.hpp"
#include "jobs/job_scheduler.hpp"
#include "jobs/job_store.hpp"
#include "jobs/run_watchdog.hpp"
#include "jobs/transfer_adapter.hpp"
#include "jobs/transfer_process.hpp"
#include "system/disk_inspector.hpp"
#include "system/file_service.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// A saved job with what the engine currently knows about it.
struct JobOverview {
    Job job;
    JobStatus status{JobStatus::IDLE};
    std::optional<int64_t> lastRun;       // start of the latest run or snapshot
    std::optional<int64_t> nextRun;       // next scheduled firing
    bool mounted{false};                  // destination is a reachable directory
    size_t snapshotCount{0};
};

void to_json(nlohmann::json& j, const JobOverview& overview);

// Command surface of the engine. Everything it needs is injected; it holds no
// process-wide state.
class Orchestrator {
public:
    Orchestrator(const AppConfig& config,
                 std::shared_ptr<ProcessSpawner> spawner,
                 std::shared_ptr<SnapshotStore> store,
                 std::shared_ptr<DiskInspector> inspector,
                 std::shared_ptr<DirectoryPicker> picker = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Fire-and-forget start from an untyped payload. Never throws: a rejected
    // start is published as a REJECTED event. Returns the run id when started.
    std::optional<std::string> runJob(const nlohmann::json& payload);

    // Typed start. Throws ValidationError, JobAlreadyRunningError or ProcessSpawnError.
    std::string startJob(const Job& job);
    bool killJob(const std::string& jobId);

    // Saved jobs. saveJob validates, persists, mirrors the config to the
    // destination when reachable and reschedules the job.
    std::vector<Job> getJobs() const;
    std::vector<JobOverview> getJobsWithStatus();
    Job saveJob(const nlohmann::json& payload);
    bool deleteJob(const std::string& jobId);
    std::optional<Job> readJobFromDestination(const std::string& destination) const;
    std::optional<int64_t> getNextRun(const std::string& jobId) const;

    // Starts every saved job that is due now that mountPath is available.
    // Returns the ids of the jobs that started.
    std::vector<std::string> handleVolumeMount(const std::string& mountPath);

    EventBus::SubscriptionId subscribe(const std::string& jobId, EventListener listener);
    bool unsubscribe(EventBus::SubscriptionId id);

    std::set<std::string> getActiveRuns() const;
    std::optional<JobRun> getRun(const std::string& jobId) const;
    std::vector<LogLine> recentLogs(const std::string& jobId) const;
    bool waitForIdle(std::chrono::milliseconds timeout);

    std::vector<DirectoryEntry> listDirectory(const std::string& path) const;
    std::optional<std::string> selectDirectory();
    SandboxResult createSandboxDirs(const std::string& source, const std::string& destination) const;
    DiskStats getDiskStats(const std::string& path);
    bool openPath(const std::string& path);
    bool revealInFileManager(const std::string& path);

    std::vector<Snapshot> querySnapshots(const std::string& jobId, const std::optional<TimeRange>& range = std::nullopt);
    std::vector<SnapshotMatch> searchPaths(const std::string& pattern,
                                           const std::optional<std::string>& jobId = std::nullopt,
                                           std::optional<size_t> limit = std::nullopt);
    HistoryStats historyStats();
    FileIndex snapshotFiles(int64_t snapshotId);
    size_t pruneHistory(const std::string& jobId, size_t keepLast);
    void rebuildIndex();
    bool verifyIndex();
    void compactHistory();

    DevSeedResult seedDatabase();
    DevBenchmarkResult benchmarkOperation(const std::string& name);
    std::vector<DevBenchmarkResult> benchmarkAll();
    DevChurnResult simulateChurn();
    DevDbStats getDbStats();
    void clearDevData();

private:
    void reject(const std::string& jobId, const std::string& error, JobErrorCode code);

    AppConfig config_;
    std::shared_ptr<SnapshotStore> store_;
    std::shared_ptr<DiskInspector> inspector_;
    std::shared_ptr<DirectoryPicker> picker_;
    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<TransferAdapter> adapter_;
    std::unique_ptr<JobRegistry> registry_;
    std::unique_ptr<RunWatchdog> watchdog_;
    std::shared_ptr<JobStore> jobStore_;
    std::unique_ptr<JobScheduler> scheduler_;
    FileService fileService_;
    DevHarness devHarness_;
};

#pragma once

#include "common/event_bus.hpp"
#include "common/sync_types.hpp"
#include "jobs/job_run.hpp"
#include "jobs/transfer_adapter.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

class SnapshotStore;

struct RegistrySettings {
    size_t logBufferLines{JobRunStateMachine::DEFAULT_LOG_CAPACITY};
    size_t retentionKeepLast{0};    // 0 keeps every snapshot
};

struct RunActivity {
    std::string jobId;
    std::string runId;
    int64_t startedAt{0};
    int64_t lastActivityAt{0};
};

// Owns the jobId -> active run map. At most one run per job id is active;
// a second start while one runs is rejected, never queued.
class JobRegistry {
public:
    JobRegistry(std::shared_ptr<TransferAdapter> adapter,
                std::shared_ptr<SnapshotStore> store,
                std::shared_ptr<EventBus> bus,
                const RegistrySettings& settings = RegistrySettings());
    ~JobRegistry();

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // Returns the new run id. Throws JobAlreadyRunningError or ProcessSpawnError;
    // on failure the job keeps its previous run state.
    std::string startJob(const Job& job);

    // No-op (returns false) when the job has no running run.
    bool killJob(const std::string& jobId, const std::string& reason = "cancelled");
    void killAll(const std::string& reason = "cancelled");

    std::set<std::string> getActiveRuns() const;
    std::optional<JobRun> getRun(const std::string& jobId) const;
    std::optional<ProgressEvent> lastProgress(const std::string& jobId) const;
    std::vector<LogLine> recentLogs(const std::string& jobId) const;
    std::vector<RunActivity> activity() const;

    // Waits until no run is active and every completion has been delivered.
    bool waitForIdle(std::chrono::milliseconds timeout);

    static std::string generateRunId();

private:
    class RunObserver;
    friend class RunObserver;

    struct ActiveRun {
        std::string runId;
        TransferHandle handle;
        std::shared_ptr<JobRunStateMachine> machine;
    };

    void handleStarted(const std::shared_ptr<JobRunStateMachine>& machine, const std::string& runId, pid_t pid);
    void handleLog(const std::shared_ptr<JobRunStateMachine>& machine, const LogLine& line);
    void handleProgress(const std::shared_ptr<JobRunStateMachine>& machine, const ProgressEvent& event);
    void handleCompleted(const std::shared_ptr<JobRunStateMachine>& machine, const TransferOutcome& outcome);
    void recordSnapshot(const std::shared_ptr<JobRunStateMachine>& machine, const JobRun& run,
                        const std::string& snapshotPath);
    void engineLog(const std::shared_ptr<JobRunStateMachine>& machine, const std::string& message);

    std::shared_ptr<TransferAdapter> adapter_;
    std::shared_ptr<SnapshotStore> store_;
    std::shared_ptr<EventBus> bus_;
    RegistrySettings settings_;

    std::map<std::string, ActiveRun> active_;
    std::map<std::string, std::shared_ptr<JobRunStateMachine>> lastRuns_;
    mutable std::mutex mutex_;
    std::condition_variable idleCondition_;
};

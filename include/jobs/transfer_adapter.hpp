#pragma once

#include "common/sync_types.hpp"
#include "jobs/transfer_command.hpp"
#include "jobs/transfer_process.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Result handed to the observer once per run.
struct TransferOutcome {
    CompletionEvent completion;
    SyncMode mode{SyncMode::ARCHIVE};
    std::optional<std::string> snapshotPath;    // finished TIME_MACHINE folder
};

// Receives the events of one run, all from that run's supervisor thread.
// onStarted comes first and onCompleted exactly once, last.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void onStarted(const std::string& runId, pid_t pid) = 0;
    virtual void onLog(const LogLine& line) = 0;
    virtual void onProgress(const ProgressEvent& event) = 0;
    virtual void onCompleted(const TransferOutcome& outcome) = 0;
};

struct TransferSettings {
    std::string rsyncPath{"rsync"};
    std::string rclonePath{"rclone"};
    std::chrono::milliseconds killGracePeriod{5000};
};

using TransferHandle = std::string;

class TransferAdapter {
public:
    TransferAdapter(std::shared_ptr<ProcessSpawner> spawner, const TransferSettings& settings);
    ~TransferAdapter();

    TransferAdapter(const TransferAdapter&) = delete;
    TransferAdapter& operator=(const TransferAdapter&) = delete;

    // Validates paths, spawns the transfer and returns without waiting for it.
    // Throws ProcessSpawnError.
    TransferHandle start(const Job& job, const std::string& runId, std::shared_ptr<TransferObserver> observer);

    // SIGTERM now, SIGKILL after the grace period. Returns false for unknown,
    // finished or already killed handles.
    bool kill(const TransferHandle& handle, const std::string& reason);

    void killAll(const std::string& reason);
    bool waitForIdle(std::chrono::milliseconds timeout);
    size_t activeCount() const;

    static void validatePaths(const Job& job);

private:
    struct RunContext;

    void supervise(std::shared_ptr<RunContext> context);
    void handleLine(RunContext& context, LogStream stream, const std::string& line);
    void emitEngineLog(RunContext& context, const std::string& message);
    CompletionEvent classify(RunContext& context, const std::optional<ProcessExit>& exit,
                             const std::optional<std::string>& ioError);
    void escalate(std::shared_ptr<RunContext> context);
    void threadStarted();
    void threadFinished();

    std::shared_ptr<ProcessSpawner> spawner_;
    TransferSettings settings_;
    TransferCommandBuilder builder_;

    std::map<TransferHandle, std::shared_ptr<RunContext>> runs_;
    mutable std::mutex mutex_;

    // Supervisor and killer threads are detached; the destructor waits for this to reach zero.
    int activeThreads_{0};
    std::mutex threadsMutex_;
    std::condition_variable threadsCondition_;
};

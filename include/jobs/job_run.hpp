#pragma once

#include "common/sync_types.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Fixed capacity buffer keeping the newest log lines. Not synchronized.
class LogRingBuffer {
public:
    explicit LogRingBuffer(size_t capacity);

    void push(const LogLine& line);
    std::vector<LogLine> lines() const;
    void clear();
    size_t size() const { return lines_.size(); }
    size_t capacity() const { return capacity_; }

private:
    std::deque<LogLine> lines_;
    size_t capacity_;
};

// Lifecycle of the current (or last) run of one job:
// IDLE -> RUNNING -> SUCCESS | FAILED, and back to RUNNING on the next start.
class JobRunStateMachine {
public:
    static constexpr size_t DEFAULT_LOG_CAPACITY = 500;

    explicit JobRunStateMachine(const Job& job, size_t logCapacity = DEFAULT_LOG_CAPACITY);

    // Throws JobAlreadyRunningError while a run is RUNNING.
    void requestStart(const std::string& runId);

    void onProgress(const ProgressEvent& event);
    void onLog(const LogLine& line);

    // RUNNING -> SUCCESS | FAILED. Returns false when the run already ended,
    // which is the case after requestKill.
    bool onComplete(bool success, const std::optional<std::string>& error, JobErrorCode code);

    // RUNNING -> FAILED with the reason as error. No-op otherwise.
    bool requestKill(const std::string& reason = "cancelled");

    const Job& job() const { return job_; }
    JobRun run() const;
    JobStatus status() const;
    bool isRunning() const;
    std::optional<ProgressEvent> lastProgress() const;
    std::vector<LogLine> recentLogs() const;
    int64_t lastActivityAt() const;

private:
    void finish(JobStatus status, const std::optional<std::string>& error, JobErrorCode code);

    const Job job_;
    JobRun run_;
    std::optional<ProgressEvent> lastProgress_;
    LogRingBuffer logs_;
    int64_t lastActivityAt_{0};
    mutable std::mutex mutex_;
};

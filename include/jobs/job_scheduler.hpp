#pragma once

#include "common/sync_types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Fires saved jobs on their periodic schedule. Each task is due
// intervalMinutes after registration or after its previous firing.
class JobScheduler {
public:
    using RunCallback = std::function<void(const Job&)>;

    explicit JobScheduler(RunCallback callback);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Replaces the registered job list and reschedules every enabled job.
    void updateJobs(const std::vector<Job>& jobs);

    // Adds or replaces the job for mount handling and reschedules it.
    // Returns whether the job now has a periodic task.
    bool registerJob(const Job& job, int64_t nowMs = nowMillis());

    // False with getLastError() when the job has no enabled periodic schedule.
    bool scheduleJob(const Job& job, int64_t nowMs = nowMillis());
    bool cancelJob(const std::string& jobId);
    void cancelAll();

    std::optional<int64_t> getNextRun(const std::string& jobId) const;
    std::vector<std::string> scheduledJobs() const;

    // Registered jobs whose destination lives under mountPath, is reachable
    // and whose schedule asks to run on mount or has a missed firing.
    std::vector<Job> handleVolumeMount(const std::string& mountPath, int64_t nowMs = nowMillis()) const;

    // Runs every task due at nowMs on the calling thread. Returns how many ran.
    size_t processDue(int64_t nowMs = nowMillis());

    void start();
    void stop();
    bool isRunning() const { return running_; }

    std::string getLastError() const;

private:
    struct Task {
        Job job;
        int64_t intervalMs{0};
        int64_t nextRunAt{0};
    };

    void schedulerLoop();
    void executeTask(const Task& task);

    RunCallback callback_;
    std::map<std::string, Task> tasks_;
    std::vector<Job> registered_;
    std::string lastError_;
    mutable std::mutex tasksMutex_;
    std::condition_variable condition_;
    std::atomic<bool> running_{false};
    std::thread schedulerThread_;
};

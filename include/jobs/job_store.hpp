#pragma once

#include "common/sync_types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Saved job configurations in <dataDir>/jobs.json. A copy of each job can be
// mirrored to <destination>/.amber-meta/job.json so it travels with the drive.
class JobStore {
public:
    static const char* const JOBS_FILENAME;
    static const char* const META_DIR;
    static const char* const JOB_CONFIG_FILENAME;

    explicit JobStore(const std::string& dataDir);

    // Missing file means no jobs. A file that does not parse is moved to
    // jobs.json.corrupt-<ms> and JobStoreError is thrown.
    std::vector<Job> loadJobs() const;
    void saveJobs(const std::vector<Job>& jobs);

    std::optional<Job> getJob(const std::string& jobId) const;

    // Insert or replace by id. Throws ValidationError for invalid jobs.
    void saveJob(const Job& job);

    // False when no job had that id.
    bool deleteJob(const std::string& jobId);

    // Best effort: false with getLastError() when the destination is not a
    // reachable directory or the file cannot be written.
    bool writeJobToDestination(const Job& job);

    // std::nullopt when the destination carries no job config.
    // Throws JobStoreError when the file exists but is not a valid job.
    static std::optional<Job> readJobFromDestination(const std::string& destination);
    static bool destinationHasJobConfig(const std::string& destination);
    static std::string destinationConfigPath(const std::string& destination);

    std::string jobsPath() const { return jobsPath_; }
    std::string getLastError() const;

private:
    std::vector<Job> readJobsLocked() const;
    void writeJobsLocked(const std::vector<Job>& jobs);

    std::string jobsPath_;
    std::string lastError_;
    mutable std::mutex mutex_;
};

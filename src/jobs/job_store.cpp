#include "jobs/job_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "jobs/job_validator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* const JobStore::JOBS_FILENAME = "jobs.json";
const char* const JobStore::META_DIR = ".amber-meta";
const char* const JobStore::JOB_CONFIG_FILENAME = "job.json";

namespace {

std::vector<Job> parseJobs(const std::string& text) {
    json root = json::parse(text);
    if (!root.is_array()) {
        throw ValidationError("jobs file root must be an array");
    }
    std::vector<Job> jobs;
    for (const auto& entry : root) {
        jobs.push_back(JobValidator::fromJson(entry));
    }
    return jobs;
}

// Write to a sibling temp file, then rename over the target.
void writeAtomic(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw JobStoreError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path temp = path;
    temp += "." + std::to_string(::getpid()) + "." + std::to_string(nowMillis()) + ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw JobStoreError("cannot write " + temp.string());
        }
        out << contents;
        out.flush();
        if (!out) {
            fs::remove(temp, ec);
            throw JobStoreError("failed writing " + temp.string());
        }
    }
    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw JobStoreError("cannot replace " + path.string() + ": " + ec.message());
    }
}

} // namespace

JobStore::JobStore(const std::string& dataDir)
    : jobsPath_((fs::path(dataDir) / JOBS_FILENAME).string()) {
}

std::vector<Job> JobStore::loadJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readJobsLocked();
}

std::vector<Job> JobStore::readJobsLocked() const {
    std::ifstream file(jobsPath_);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(jobsPath_, ec)) {
            return {};
        }
        throw JobStoreError("cannot read " + jobsPath_);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    try {
        return parseJobs(buffer.str());
    } catch (const std::exception& e) {
        std::string backup = jobsPath_ + ".corrupt-" + std::to_string(nowMillis());
        std::error_code ec;
        fs::rename(jobsPath_, backup, ec);
        if (ec) {
            throw JobStoreError("failed to parse " + jobsPath_ + " and could not move it aside: " + ec.message());
        }
        Logger::error("Moved corrupt job file " + jobsPath_ + " to " + backup);
        throw JobStoreError("failed to parse " + jobsPath_ + ", moved it to " + backup + ": " + e.what());
    }
}

void JobStore::saveJobs(const std::vector<Job>& jobs) {
    std::lock_guard<std::mutex> lock(mutex_);
    writeJobsLocked(jobs);
}

void JobStore::writeJobsLocked(const std::vector<Job>& jobs) {
    writeAtomic(jobsPath_, json(jobs).dump(2));
}

std::optional<Job> JobStore::getJob(const std::string& jobId) const {
    for (const auto& job : loadJobs()) {
        if (job.id == jobId) {
            return job;
        }
    }
    return std::nullopt;
}

void JobStore::saveJob(const Job& job) {
    JobValidator::validate(job);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs = readJobsLocked();
    auto it = std::find_if(jobs.begin(), jobs.end(), [&job](const Job& other) { return other.id == job.id; });
    if (it != jobs.end()) {
        *it = job;
    } else {
        jobs.push_back(job);
    }
    writeJobsLocked(jobs);
    Logger::info("Saved job " + job.id);
}

bool JobStore::deleteJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs = readJobsLocked();
    auto it = std::remove_if(jobs.begin(), jobs.end(), [&jobId](const Job& job) { return job.id == jobId; });
    if (it == jobs.end()) {
        return false;
    }
    jobs.erase(it, jobs.end());
    writeJobsLocked(jobs);
    Logger::info("Deleted job " + jobId);
    return true;
}

bool JobStore::writeJobToDestination(const Job& job) {
    std::error_code ec;
    if (!fs::is_directory(job.destination, ec)) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = "Destination path is not accessible: " + job.destination;
        return false;
    }

    try {
        writeAtomic(destinationConfigPath(job.destination), json(job).dump(2));
    } catch (const JobStoreError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = e.what();
        return false;
    }
    Logger::info("Wrote job config to " + destinationConfigPath(job.destination));
    return true;
}

std::optional<Job> JobStore::readJobFromDestination(const std::string& destination) {
    const std::string path = destinationConfigPath(destination);
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return JobValidator::fromString(buffer.str());
    } catch (const ValidationError& e) {
        throw JobStoreError("invalid job config " + path + ": " + e.what());
    }
}

bool JobStore::destinationHasJobConfig(const std::string& destination) {
    std::error_code ec;
    return fs::is_regular_file(destinationConfigPath(destination), ec);
}

std::string JobStore::destinationConfigPath(const std::string& destination) {
    return (fs::path(destination) / META_DIR / JOB_CONFIG_FILENAME).string();
}

std::string JobStore::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

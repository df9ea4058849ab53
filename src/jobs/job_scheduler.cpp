#include "jobs/job_scheduler.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace {

constexpr int64_t MINUTE_MS = 60 * 1000;

// "/media/usb" contains "/media/usb/backups" but not "/media/usb2".
bool isUnderMount(const std::string& path, const std::string& mountPath) {
    std::string mount = mountPath;
    while (mount.size() > 1 && mount.back() == '/') {
        mount.pop_back();
    }
    if (path.compare(0, mount.size(), mount) != 0) {
        return false;
    }
    return path.size() == mount.size() || mount == "/" || path[mount.size()] == '/';
}

} // namespace

JobScheduler::JobScheduler(RunCallback callback)
    : callback_(callback) {
    if (!callback_) {
        throw std::invalid_argument("JobScheduler requires a run callback");
    }
}

JobScheduler::~JobScheduler() {
    stop();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
}

void JobScheduler::updateJobs(const std::vector<Job>& jobs) {
    cancelAll();
    for (const auto& job : jobs) {
        registerJob(job);
    }
}

bool JobScheduler::registerJob(const Job& job, int64_t nowMs) {
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        auto it = std::find_if(registered_.begin(), registered_.end(),
                               [&job](const Job& other) { return other.id == job.id; });
        if (it != registered_.end()) {
            *it = job;
        } else {
            registered_.push_back(job);
        }
        tasks_.erase(job.id);
        condition_.notify_one();
    }
    if (job.schedule && job.schedule->enabled && job.schedule->intervalMinutes > 0) {
        return scheduleJob(job, nowMs);
    }
    return false;
}

bool JobScheduler::scheduleJob(const Job& job, int64_t nowMs) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (!job.schedule) {
        lastError_ = "Job " + job.id + " has no schedule";
        return false;
    }
    if (!job.schedule->enabled || job.schedule->intervalMinutes <= 0) {
        lastError_ = "Job " + job.id + " has no enabled periodic schedule";
        return false;
    }

    Task task;
    task.job = job;
    task.intervalMs = job.schedule->intervalMinutes * MINUTE_MS;
    task.nextRunAt = nowMs + task.intervalMs;
    tasks_[job.id] = task;

    auto it = std::find_if(registered_.begin(), registered_.end(),
                           [&job](const Job& other) { return other.id == job.id; });
    if (it != registered_.end()) {
        *it = job;
    } else {
        registered_.push_back(job);
    }

    Logger::info("Scheduled job " + job.id + " every " + std::to_string(job.schedule->intervalMinutes) +
                 " minutes");
    condition_.notify_one();
    return true;
}

bool JobScheduler::cancelJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    registered_.erase(std::remove_if(registered_.begin(), registered_.end(),
                                     [&jobId](const Job& job) { return job.id == jobId; }),
                      registered_.end());
    if (tasks_.erase(jobId) == 0) {
        return false;
    }
    Logger::info("Cancelled schedule for job " + jobId);
    condition_.notify_one();
    return true;
}

void JobScheduler::cancelAll() {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    tasks_.clear();
    registered_.clear();
    condition_.notify_one();
}

std::optional<int64_t> JobScheduler::getNextRun(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    auto it = tasks_.find(jobId);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.nextRunAt;
}

std::vector<std::string> JobScheduler::scheduledJobs() const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    std::vector<std::string> ids;
    for (const auto& pair : tasks_) {
        ids.push_back(pair.first);
    }
    return ids;
}

std::vector<Job> JobScheduler::handleVolumeMount(const std::string& mountPath, int64_t nowMs) const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    std::vector<Job> due;
    for (const auto& job : registered_) {
        if (!job.schedule || !job.schedule->enabled || !isUnderMount(job.destination, mountPath)) {
            continue;
        }
        std::error_code ec;
        if (!std::filesystem::exists(job.destination, ec)) {
            Logger::info("Job " + job.id + " matched mount " + mountPath + " but " + job.destination +
                         " is not accessible");
            continue;
        }

        auto task = tasks_.find(job.id);
        bool missed = task != tasks_.end() && task->second.nextRunAt <= nowMs;
        if (job.schedule->runOnMount || missed) {
            Logger::info("Job " + job.id + " is due on mount of " + mountPath);
            due.push_back(job);
        }
    }
    return due;
}

size_t JobScheduler::processDue(int64_t nowMs) {
    std::vector<Task> ready;
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        for (auto& pair : tasks_) {
            if (pair.second.nextRunAt <= nowMs) {
                ready.push_back(pair.second);
                pair.second.nextRunAt = nowMs + pair.second.intervalMs;
            }
        }
    }
    for (const auto& task : ready) {
        executeTask(task);
    }
    return ready.size();
}

void JobScheduler::start() {
    if (!running_) {
        if (schedulerThread_.joinable()) {
            schedulerThread_.join();
        }
        running_ = true;
        schedulerThread_ = std::thread(&JobScheduler::schedulerLoop, this);
    }
}

void JobScheduler::stop() {
    if (running_) {
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            running_ = false;
        }
        condition_.notify_all();
    }
}

std::string JobScheduler::getLastError() const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return lastError_;
}

void JobScheduler::executeTask(const Task& task) {
    Logger::info("Executing scheduled job " + task.job.name + " (" + task.job.id + ")");
    try {
        callback_(task.job);
    } catch (const std::exception& e) {
        Logger::error("Scheduled run of job " + task.job.id + " failed: " + e.what());
    }
}

void JobScheduler::schedulerLoop() {
    while (running_) {
        std::unique_lock<std::mutex> lock(tasksMutex_);
        if (!running_) {
            break;
        }

        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_ || !tasks_.empty();
            });
            continue;
        }

        auto next = std::min_element(tasks_.begin(), tasks_.end(),
            [](const auto& a, const auto& b) {
                return a.second.nextRunAt < b.second.nextRunAt;
            });
        int64_t now = nowMillis();
        if (next->second.nextRunAt > now) {
            // Woken early on any schedule change to pick the new earliest task.
            condition_.wait_for(lock, std::chrono::milliseconds(next->second.nextRunAt - now));
            continue;
        }

        lock.unlock();
        processDue(now);
    }
}

#include "jobs/run_watchdog.hpp"
#include "common/logger.hpp"
#include "common/sync_types.hpp"
#include "jobs/job_registry.hpp"

RunWatchdog::RunWatchdog(JobRegistry& registry, const WatchdogPolicy& policy)
    : registry_(registry)
    , policy_(policy) {
}

RunWatchdog::~RunWatchdog() {
    stop();
}

void RunWatchdog::start() {
    if (!policy_.enabled() || running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&RunWatchdog::watchLoop, this);
    Logger::info("Run watchdog started (stall " + std::to_string(policy_.stallTimeoutSeconds) +
                 "s, timeout " + std::to_string(policy_.runTimeoutSeconds) + "s)");
}

void RunWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    condition_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::vector<std::string> RunWatchdog::checkOnce(int64_t now) {
    std::vector<std::string> killed;
    for (const auto& run : registry_.activity()) {
        std::string reason;
        if (policy_.runTimeoutSeconds > 0 &&
            now - run.startedAt >= static_cast<int64_t>(policy_.runTimeoutSeconds) * 1000) {
            reason = "Backup timed out after " + std::to_string(policy_.runTimeoutSeconds) + " seconds";
        } else if (policy_.stallTimeoutSeconds > 0 &&
                   now - run.lastActivityAt >= static_cast<int64_t>(policy_.stallTimeoutSeconds) * 1000) {
            reason = "Backup stalled after " + std::to_string(policy_.stallTimeoutSeconds) + " seconds";
        }

        if (!reason.empty() && registry_.killJob(run.jobId, reason)) {
            Logger::warning("Job " + run.jobId + ": " + reason);
            killed.push_back(run.jobId);
        }
    }
    return killed;
}

void RunWatchdog::watchLoop() {
    while (running_) {
        try {
            checkOnce(nowMillis());
        } catch (const std::exception& e) {
            Logger::error(std::string("Watchdog pass failed: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, policy_.interval, [this] { return !running_; });
    }
}

#include "jobs/job_run.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

LogRingBuffer::LogRingBuffer(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void LogRingBuffer::push(const LogLine& line) {
    if (lines_.size() == capacity_) {
        lines_.pop_front();
    }
    lines_.push_back(line);
}

std::vector<LogLine> LogRingBuffer::lines() const {
    return std::vector<LogLine>(lines_.begin(), lines_.end());
}

void LogRingBuffer::clear() {
    lines_.clear();
}

JobRunStateMachine::JobRunStateMachine(const Job& job, size_t logCapacity)
    : job_(job)
    , logs_(logCapacity) {
    run_.jobId = job.id;
    run_.mode = job.mode;
    run_.status = JobStatus::IDLE;
}

void JobRunStateMachine::requestStart(const std::string& runId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_.status == JobStatus::RUNNING) {
        throw JobAlreadyRunningError(job_.id);
    }

    run_ = JobRun{};
    run_.jobId = job_.id;
    run_.runId = runId;
    run_.mode = job_.mode;
    run_.status = JobStatus::RUNNING;
    run_.startedAt = nowMillis();
    lastActivityAt_ = run_.startedAt;
    lastProgress_.reset();
    logs_.clear();
}

void JobRunStateMachine::onProgress(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastProgress_ = event;
    lastActivityAt_ = nowMillis();
}

void JobRunStateMachine::onLog(const LogLine& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.push(line);
    lastActivityAt_ = nowMillis();
}

bool JobRunStateMachine::onComplete(bool success, const std::optional<std::string>& error, JobErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_.status != JobStatus::RUNNING) {
        Logger::debug("Ignoring completion of run " + run_.runId + " in state " + toString(run_.status));
        return false;
    }
    if (success) {
        finish(JobStatus::SUCCESS, std::nullopt, JobErrorCode::NONE);
    } else {
        finish(JobStatus::FAILED, error ? error : std::optional<std::string>("failed"), code);
    }
    return true;
}

bool JobRunStateMachine::requestKill(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_.status != JobStatus::RUNNING) {
        return false;
    }
    finish(JobStatus::FAILED, reason.empty() ? std::string("cancelled") : reason, JobErrorCode::CANCELLED);
    return true;
}

void JobRunStateMachine::finish(JobStatus status, const std::optional<std::string>& error, JobErrorCode code) {
    run_.status = status;
    run_.endedAt = nowMillis();
    run_.error = error;
    run_.errorCode = code;
}

JobRun JobRunStateMachine::run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_;
}

JobStatus JobRunStateMachine::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_.status;
}

bool JobRunStateMachine::isRunning() const {
    return status() == JobStatus::RUNNING;
}

std::optional<ProgressEvent> JobRunStateMachine::lastProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastProgress_;
}

std::vector<LogLine> JobRunStateMachine::recentLogs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_.lines();
}

int64_t JobRunStateMachine::lastActivityAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastActivityAt_;
}

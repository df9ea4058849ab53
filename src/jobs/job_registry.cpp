#include "jobs/job_registry.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "history/snapshot_scanner.hpp"
#include "history/snapshot_store.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

class JobRegistry::RunObserver : public TransferObserver {
public:
    RunObserver(JobRegistry* registry, std::shared_ptr<JobRunStateMachine> machine)
        : registry_(registry)
        , machine_(machine) {
    }

    void onStarted(const std::string& runId, pid_t pid) override {
        registry_->handleStarted(machine_, runId, pid);
    }

    void onLog(const LogLine& line) override {
        registry_->handleLog(machine_, line);
    }

    void onProgress(const ProgressEvent& event) override {
        registry_->handleProgress(machine_, event);
    }

    void onCompleted(const TransferOutcome& outcome) override {
        registry_->handleCompleted(machine_, outcome);
    }

private:
    JobRegistry* registry_;
    std::shared_ptr<JobRunStateMachine> machine_;
};

JobRegistry::JobRegistry(std::shared_ptr<TransferAdapter> adapter,
                         std::shared_ptr<SnapshotStore> store,
                         std::shared_ptr<EventBus> bus,
                         const RegistrySettings& settings)
    : adapter_(adapter)
    , store_(store)
    , bus_(bus)
    , settings_(settings) {
    if (!adapter_ || !bus_) {
        throw std::invalid_argument("JobRegistry requires a transfer adapter and an event bus");
    }
}

JobRegistry::~JobRegistry() {
    try {
        killAll("shutdown");
        // Supervisor threads call back into this object until they finish.
        while (!waitForIdle(std::chrono::seconds(5))) {
            Logger::warning("Waiting for transfer processes to exit");
        }
    } catch (const std::exception& e) {
        Logger::error("Error during JobRegistry cleanup: " + std::string(e.what()));
    }
}

std::string JobRegistry::generateRunId() {
    auto now = std::chrono::system_clock::now();
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << nowMs.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }
    return ss.str();
}

std::string JobRegistry::startJob(const Job& job) {
    const std::string runId = generateRunId();
    auto machine = std::make_shared<JobRunStateMachine>(job, settings_.logBufferLines);

    std::shared_ptr<JobRunStateMachine> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.count(job.id) > 0) {
            Logger::warning("Rejected start of job " + job.id + ": already running");
            throw JobAlreadyRunningError(job.id);
        }
        machine->requestStart(runId);
        active_[job.id] = ActiveRun{runId, runId, machine};

        auto it = lastRuns_.find(job.id);
        if (it != lastRuns_.end()) {
            previous = it->second;
        }
        lastRuns_[job.id] = machine;
    }

    try {
        adapter_->start(job, runId, std::make_shared<RunObserver>(this, machine));
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(job.id);
        if (previous) {
            lastRuns_[job.id] = previous;
        } else {
            lastRuns_.erase(job.id);
        }
        idleCondition_.notify_all();
        throw;
    }

    Logger::info("Started run " + runId + " of job " + job.id + " (" + toString(job.mode) + ")");

    // killJob may have run before the adapter knew this handle; deliver it now.
    JobRun started = machine->run();
    if (started.status == JobStatus::FAILED && started.errorCode == JobErrorCode::CANCELLED) {
        Logger::info("Delivering kill requested while run " + runId + " was starting");
        adapter_->kill(runId, started.error.value_or("cancelled"));
    }
    return runId;
}

bool JobRegistry::killJob(const std::string& jobId, const std::string& reason) {
    ActiveRun run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(jobId);
        if (it == active_.end()) {
            return false;
        }
        run = it->second;
    }

    if (!run.machine->requestKill(reason)) {
        return false;
    }
    Logger::info("Killing run " + run.runId + " of job " + jobId + ": " + reason);
    if (!adapter_->kill(run.handle, reason)) {
        // Either the process already exited or startJob has not registered it
        // yet; startJob re-checks the machine after registration.
        Logger::debug("Run " + run.runId + " has no live process to signal yet");
    }
    return true;
}

void JobRegistry::killAll(const std::string& reason) {
    for (const auto& jobId : getActiveRuns()) {
        killJob(jobId, reason);
    }
}

std::set<std::string> JobRegistry::getActiveRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> ids;
    for (const auto& pair : active_) {
        ids.insert(pair.first);
    }
    return ids;
}

std::optional<JobRun> JobRegistry::getRun(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastRuns_.find(jobId);
    if (it == lastRuns_.end()) {
        return std::nullopt;
    }
    return it->second->run();
}

std::optional<ProgressEvent> JobRegistry::lastProgress(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastRuns_.find(jobId);
    if (it == lastRuns_.end()) {
        return std::nullopt;
    }
    return it->second->lastProgress();
}

std::vector<LogLine> JobRegistry::recentLogs(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastRuns_.find(jobId);
    if (it == lastRuns_.end()) {
        return {};
    }
    return it->second->recentLogs();
}

std::vector<RunActivity> JobRegistry::activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RunActivity> result;
    for (const auto& pair : active_) {
        JobRun run = pair.second.machine->run();
        if (run.status != JobStatus::RUNNING) {
            continue;
        }
        result.push_back(RunActivity{pair.first, run.runId, run.startedAt, pair.second.machine->lastActivityAt()});
    }
    return result;
}

bool JobRegistry::waitForIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!idleCondition_.wait_until(lock, deadline, [this] { return active_.empty(); })) {
            return false;
        }
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return adapter_->waitForIdle(std::max(remaining, std::chrono::milliseconds(0)));
}

void JobRegistry::handleStarted(const std::shared_ptr<JobRunStateMachine>& machine, const std::string& runId,
                                pid_t pid) {
    Logger::debug("Run " + runId + " of job " + machine->job().id + " has PID " + std::to_string(pid));
    bus_->publish(JobEvent::started(machine->job().id, runId));
}

void JobRegistry::handleLog(const std::shared_ptr<JobRunStateMachine>& machine, const LogLine& line) {
    machine->onLog(line);
    bus_->publish(JobEvent::fromLog(line));
}

void JobRegistry::handleProgress(const std::shared_ptr<JobRunStateMachine>& machine, const ProgressEvent& event) {
    machine->onProgress(event);
    bus_->publish(JobEvent::fromProgress(event));
}

void JobRegistry::engineLog(const std::shared_ptr<JobRunStateMachine>& machine, const std::string& message) {
    LogLine line;
    line.jobId = machine->job().id;
    line.runId = machine->run().runId;
    line.timestamp = nowMillis();
    line.stream = LogStream::ENGINE;
    line.message = message;
    handleLog(machine, line);
}

void JobRegistry::handleCompleted(const std::shared_ptr<JobRunStateMachine>& machine,
                                  const TransferOutcome& outcome) {
    const CompletionEvent& reported = outcome.completion;
    machine->onComplete(reported.success, reported.error, reported.errorCode);

    // A kill that raced the exit wins: the final state is the machine's, not the process's.
    JobRun run = machine->run();
    if (run.status == JobStatus::SUCCESS && outcome.mode == SyncMode::TIME_MACHINE && outcome.snapshotPath) {
        recordSnapshot(machine, run, *outcome.snapshotPath);
    }

    CompletionEvent completion;
    completion.jobId = run.jobId;
    completion.runId = run.runId;
    completion.success = run.status == JobStatus::SUCCESS;
    completion.error = run.error;
    completion.errorCode = run.errorCode;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(run.jobId);
        if (it != active_.end() && it->second.runId == run.runId) {
            active_.erase(it);
        }
    }

    bus_->publish(JobEvent::fromCompletion(completion));

    std::lock_guard<std::mutex> lock(mutex_);
    idleCondition_.notify_all();
}

void JobRegistry::recordSnapshot(const std::shared_ptr<JobRunStateMachine>& machine, const JobRun& run,
                                 const std::string& snapshotPath) {
    if (!store_) {
        return;
    }

    SnapshotScanner scanner;
    FileIndex files;
    if (!scanner.scan(snapshotPath, files)) {
        engineLog(machine, "Snapshot indexing skipped: " + scanner.getLastError());
        Logger::error("Cannot index snapshot " + snapshotPath + ": " + scanner.getLastError());
        return;
    }

    try {
        Snapshot snapshot = store_->commit(run, files, snapshotPath);
        engineLog(machine, "Indexed snapshot " + std::to_string(snapshot.snapshotId) + " (" +
                           std::to_string(snapshot.fileCount) + " files)");

        if (settings_.retentionKeepLast > 0) {
            size_t removed = store_->pruneRetention(run.jobId, settings_.retentionKeepLast);
            if (removed > 0) {
                engineLog(machine, "Pruned " + std::to_string(removed) + " old snapshot records");
            }
        }
    } catch (const AmberError& e) {
        engineLog(machine, std::string("Snapshot indexing failed: ") + e.what());
        Logger::error(std::string("Snapshot commit failed for run ") + run.runId + ": " + e.what());
    }
}

#include "app/orchestrator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "jobs/job_validator.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

namespace {

DevHarnessOptions devOptions(const AppConfig& config) {
    DevHarnessOptions options;
    options.playgroundDir = config.playgroundDir;
    return options;
}

TransferSettings transferSettings(const AppConfig& config) {
    TransferSettings settings;
    settings.rsyncPath = config.rsyncPath;
    settings.rclonePath = config.rclonePath;
    settings.killGracePeriod = std::chrono::milliseconds(config.killGracePeriodMs);
    return settings;
}

} // namespace

void to_json(json& j, const JobOverview& overview) {
    j = overview.job;
    j["status"] = toString(overview.status);
    j["lastRun"] = overview.lastRun ? json(*overview.lastRun) : json(nullptr);
    j["nextRun"] = overview.nextRun ? json(*overview.nextRun) : json(nullptr);
    j["mounted"] = overview.mounted;
    j["snapshotCount"] = overview.snapshotCount;
}

Orchestrator::Orchestrator(const AppConfig& config,
                           std::shared_ptr<ProcessSpawner> spawner,
                           std::shared_ptr<SnapshotStore> store,
                           std::shared_ptr<DiskInspector> inspector,
                           std::shared_ptr<DirectoryPicker> picker)
    : config_(config)
    , store_(store)
    , inspector_(inspector)
    , picker_(picker)
    , bus_(std::make_shared<EventBus>())
    , adapter_(std::make_shared<TransferAdapter>(spawner, transferSettings(config)))
    , fileService_()
    , devHarness_(store, devOptions(config)) {
    if (!store_ || !inspector_) {
        throw std::invalid_argument("Orchestrator requires a snapshot store and a disk inspector");
    }

    RegistrySettings settings;
    settings.logBufferLines = static_cast<size_t>(config.logBufferLines);
    settings.retentionKeepLast = static_cast<size_t>(config.retentionKeepLast);
    registry_ = std::make_unique<JobRegistry>(adapter_, store_, bus_, settings);

    WatchdogPolicy policy;
    policy.stallTimeoutSeconds = config.stallTimeoutSeconds;
    policy.runTimeoutSeconds = config.runTimeoutSeconds;
    policy.interval = std::chrono::milliseconds(config.watchdogIntervalMs);
    watchdog_ = std::make_unique<RunWatchdog>(*registry_, policy);
    watchdog_->start();

    jobStore_ = std::make_shared<JobStore>(config.dataDir);
    scheduler_ = std::make_unique<JobScheduler>([this](const Job& job) { runJob(json(job)); });
    try {
        scheduler_->updateJobs(jobStore_->loadJobs());
    } catch (const JobStoreError& e) {
        Logger::error(std::string("Scheduled jobs not loaded: ") + e.what());
    }
    scheduler_->start();
}

Orchestrator::~Orchestrator() {
    scheduler_->stop();
    scheduler_.reset();
    watchdog_->stop();
    watchdog_.reset();
    registry_.reset();
}

void Orchestrator::reject(const std::string& jobId, const std::string& error, JobErrorCode code) {
    Logger::warning("Rejected job " + (jobId.empty() ? std::string("<unknown>") : jobId) + ": " + error);
    bus_->publish(JobEvent::rejected(jobId, error, code));
}

std::optional<std::string> Orchestrator::runJob(const json& payload) {
    std::string jobId;
    if (payload.is_object() && payload.contains("id") && payload.at("id").is_string()) {
        jobId = payload.at("id").get<std::string>();
    }

    try {
        Job job = JobValidator::fromJson(payload);
        return registry_->startJob(job);
    } catch (const ValidationError& e) {
        reject(jobId, e.what(), JobErrorCode::VALIDATION_FAILED);
    } catch (const JobAlreadyRunningError& e) {
        reject(jobId, e.what(), JobErrorCode::ALREADY_RUNNING);
    } catch (const ProcessSpawnError& e) {
        reject(jobId, e.what(), JobErrorCode::SPAWN_FAILURE);
    } catch (const std::exception& e) {
        reject(jobId, e.what(), JobErrorCode::IO_ERROR);
    }
    return std::nullopt;
}

std::string Orchestrator::startJob(const Job& job) {
    JobValidator::validate(job);
    return registry_->startJob(job);
}

bool Orchestrator::killJob(const std::string& jobId) {
    return registry_->killJob(jobId);
}

std::vector<Job> Orchestrator::getJobs() const {
    return jobStore_->loadJobs();
}

std::vector<JobOverview> Orchestrator::getJobsWithStatus() {
    std::vector<JobOverview> result;
    for (const auto& job : jobStore_->loadJobs()) {
        JobOverview overview;
        overview.job = job;
        std::error_code ec;
        overview.mounted = std::filesystem::is_directory(job.destination, ec);
        overview.nextRun = scheduler_->getNextRun(job.id);

        std::vector<Snapshot> snapshots = store_->query(job.id);
        overview.snapshotCount = snapshots.size();
        if (!snapshots.empty()) {
            overview.lastRun = snapshots.front().createdAt;
        }
        if (auto run = registry_->getRun(job.id)) {
            overview.status = run->status;
            overview.lastRun = std::max(overview.lastRun.value_or(0), run->startedAt);
        }
        result.push_back(overview);
    }
    return result;
}

Job Orchestrator::saveJob(const json& payload) {
    Job job = JobValidator::fromJson(payload);
    jobStore_->saveJob(job);
    if (!jobStore_->writeJobToDestination(job)) {
        Logger::warning("Job " + job.id + " config not mirrored to destination: " + jobStore_->getLastError());
    }

    scheduler_->registerJob(job);
    return job;
}

bool Orchestrator::deleteJob(const std::string& jobId) {
    scheduler_->cancelJob(jobId);
    return jobStore_->deleteJob(jobId);
}

std::optional<Job> Orchestrator::readJobFromDestination(const std::string& destination) const {
    return JobStore::readJobFromDestination(destination);
}

std::optional<int64_t> Orchestrator::getNextRun(const std::string& jobId) const {
    return scheduler_->getNextRun(jobId);
}

std::vector<std::string> Orchestrator::handleVolumeMount(const std::string& mountPath) {
    std::vector<std::string> started;
    for (const auto& job : scheduler_->handleVolumeMount(mountPath)) {
        if (runJob(json(job))) {
            started.push_back(job.id);
        }
    }
    return started;
}

EventBus::SubscriptionId Orchestrator::subscribe(const std::string& jobId, EventListener listener) {
    return bus_->subscribe(jobId, listener);
}

bool Orchestrator::unsubscribe(EventBus::SubscriptionId id) {
    return bus_->unsubscribe(id);
}

std::set<std::string> Orchestrator::getActiveRuns() const {
    return registry_->getActiveRuns();
}

std::optional<JobRun> Orchestrator::getRun(const std::string& jobId) const {
    return registry_->getRun(jobId);
}

std::vector<LogLine> Orchestrator::recentLogs(const std::string& jobId) const {
    return registry_->recentLogs(jobId);
}

bool Orchestrator::waitForIdle(std::chrono::milliseconds timeout) {
    return registry_->waitForIdle(timeout);
}

std::vector<DirectoryEntry> Orchestrator::listDirectory(const std::string& path) const {
    return fileService_.listDirectory(path);
}

std::optional<std::string> Orchestrator::selectDirectory() {
    if (!picker_) {
        return std::nullopt;
    }
    return picker_->pickDirectory();
}

SandboxResult Orchestrator::createSandboxDirs(const std::string& source, const std::string& destination) const {
    return fileService_.createSandboxDirs(source, destination);
}

DiskStats Orchestrator::getDiskStats(const std::string& path) {
    return inspector_->stat(path);
}

bool Orchestrator::openPath(const std::string& path) {
    return fileService_.openPath(path);
}

bool Orchestrator::revealInFileManager(const std::string& path) {
    return fileService_.revealInFileManager(path);
}

std::vector<Snapshot> Orchestrator::querySnapshots(const std::string& jobId, const std::optional<TimeRange>& range) {
    return store_->query(jobId, range);
}

std::vector<SnapshotMatch> Orchestrator::searchPaths(const std::string& pattern,
                                                     const std::optional<std::string>& jobId,
                                                     std::optional<size_t> limit) {
    return store_->searchPaths(pattern, jobId, limit);
}

HistoryStats Orchestrator::historyStats() {
    return store_->stats();
}

FileIndex Orchestrator::snapshotFiles(int64_t snapshotId) {
    return store_->snapshotFiles(snapshotId);
}

size_t Orchestrator::pruneHistory(const std::string& jobId, size_t keepLast) {
    return store_->pruneRetention(jobId, keepLast);
}

void Orchestrator::rebuildIndex() {
    store_->rebuildIndex();
}

bool Orchestrator::verifyIndex() {
    return store_->verifyIndex();
}

void Orchestrator::compactHistory() {
    store_->compact();
}

DevSeedResult Orchestrator::seedDatabase() {
    return devHarness_.seed();
}

DevBenchmarkResult Orchestrator::benchmarkOperation(const std::string& name) {
    return devHarness_.benchmarkOperation(name);
}

std::vector<DevBenchmarkResult> Orchestrator::benchmarkAll() {
    return devHarness_.benchmarkAll();
}

DevChurnResult Orchestrator::simulateChurn() {
    return devHarness_.simulateChurn();
}

DevDbStats Orchestrator::getDbStats() {
    return devHarness_.getDbStats();
}

void Orchestrator::clearDevData() {
    devHarness_.clear();
}

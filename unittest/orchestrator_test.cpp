#include <gtest/gtest.h>
#include "app/orchestrator.hpp"
#include "common/errors.hpp"
#include "jobs/job_validator.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

class FixedPicker : public DirectoryPicker {
public:
    explicit FixedPicker(std::optional<std::string> choice) : choice_(choice) {}
    std::optional<std::string> pickDirectory() override { return choice_; }

private:
    std::optional<std::string> choice_;
};

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = makeTestDir("amber_orchestrator_test");
        writeTextFile(testDir_ / "src" / "a.txt", "alpha");
        writeTextFile(testDir_ / "src" / "b" / "c.txt", "gamma");

        config_ = AppConfig::fromJson(json{
            {"dataDir", (testDir_ / "data").string()},
            {"playgroundDir", (testDir_ / "playground").string()},
            {"rsyncPath", writeCopyScript(testDir_ / "copy-rsync")},
            {"killGracePeriodMs", 1000}
        });
        sleepScript_ = writeSleepScript(testDir_ / "sleep-rsync");
    }

    void TearDown() override {
        orchestrator_.reset();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    void createOrchestrator(std::shared_ptr<DirectoryPicker> picker = nullptr) {
        auto store = std::make_shared<SnapshotStore>(config_.databasePath);
        orchestrator_ = std::make_unique<Orchestrator>(config_, std::make_shared<PosixProcessSpawner>(), store,
                                                       std::make_shared<FilesystemDiskInspector>(), picker);
        orchestrator_->subscribe("", queue_.listener());
    }

    json jobPayload(const std::string& mode) {
        return json{
            {"id", "j1"},
            {"source", (testDir_ / "src").string()},
            {"destination", (testDir_ / "dest").string()},
            {"mode", mode}
        };
    }

    std::optional<JobEvent> nextTerminalEvent() {
        while (auto event = queue_.waitNext(std::chrono::seconds(10))) {
            if (event->type == JobEvent::Type::COMPLETED || event->type == JobEvent::Type::REJECTED) {
                return event;
            }
        }
        return std::nullopt;
    }

    fs::path testDir_;
    AppConfig config_;
    std::string sleepScript_;
    EventQueue queue_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

TEST_F(OrchestratorTest, RunJobStreamsToCompletion) {
    createOrchestrator();

    auto runId = orchestrator_->runJob(jobPayload("MIRROR"));
    ASSERT_TRUE(runId.has_value());

    auto event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEvent::Type::COMPLETED);
    EXPECT_TRUE(event->completion->success);
    EXPECT_EQ(event->runId, *runId);

    ASSERT_TRUE(orchestrator_->waitForIdle(std::chrono::seconds(5)));
    EXPECT_EQ(orchestrator_->getRun("j1")->status, JobStatus::SUCCESS);
    EXPECT_TRUE(orchestrator_->getActiveRuns().empty());
    EXPECT_FALSE(orchestrator_->recentLogs("j1").empty());
}

TEST_F(OrchestratorTest, MalformedPayloadIsRejected) {
    createOrchestrator();

    json payload = jobPayload("MIRROR");
    payload.erase("source");
    EXPECT_FALSE(orchestrator_->runJob(payload).has_value());

    auto event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEvent::Type::REJECTED);
    EXPECT_EQ(event->jobId, "j1");
    EXPECT_EQ(event->completion->errorCode, JobErrorCode::VALIDATION_FAILED);
    EXPECT_FALSE(orchestrator_->getRun("j1").has_value());
}

TEST_F(OrchestratorTest, SpawnFailureIsRejected) {
    config_.rsyncPath = (testDir_ / "no-such-rsync").string();
    createOrchestrator();

    EXPECT_FALSE(orchestrator_->runJob(jobPayload("ARCHIVE")).has_value());
    auto event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEvent::Type::REJECTED);
    EXPECT_EQ(event->completion->errorCode, JobErrorCode::SPAWN_FAILURE);
}

TEST_F(OrchestratorTest, SecondStartIsRejectedWhileRunning) {
    config_.rsyncPath = sleepScript_;
    createOrchestrator();

    ASSERT_TRUE(orchestrator_->runJob(jobPayload("MIRROR")).has_value());
    EXPECT_FALSE(orchestrator_->runJob(jobPayload("MIRROR")).has_value());

    auto event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEvent::Type::REJECTED);
    EXPECT_EQ(event->completion->errorCode, JobErrorCode::ALREADY_RUNNING);
    EXPECT_THROW(orchestrator_->startJob(JobValidator::fromJson(jobPayload("MIRROR"))), JobAlreadyRunningError);

    EXPECT_TRUE(orchestrator_->killJob("j1"));
    event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEvent::Type::COMPLETED);
    EXPECT_EQ(event->completion->errorCode, JobErrorCode::CANCELLED);
    EXPECT_FALSE(orchestrator_->killJob("j1"));
}

TEST_F(OrchestratorTest, TimeMachineRunIsSearchable) {
    createOrchestrator();

    ASSERT_TRUE(orchestrator_->runJob(jobPayload("TIME_MACHINE")).has_value());
    auto event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->completion->success);

    auto snapshots = orchestrator_->querySnapshots("j1");
    ASSERT_EQ(snapshots.size(), 1u);
    auto matches = orchestrator_->searchPaths("c.txt");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].paths[0], "/b/c.txt");
    EXPECT_EQ(orchestrator_->snapshotFiles(snapshots[0].snapshotId).size(), 2u);
    EXPECT_EQ(orchestrator_->historyStats().snapshotCount, 1u);
    EXPECT_TRUE(orchestrator_->verifyIndex());

    EXPECT_EQ(orchestrator_->pruneHistory("j1", 0), 1u);
    EXPECT_TRUE(orchestrator_->querySnapshots("j1").empty());
}

TEST_F(OrchestratorTest, DiskAndFileOperations) {
    createOrchestrator();

    DiskStats missing = orchestrator_->getDiskStats("/nonexistent");
    EXPECT_EQ(missing.status, DiskStatus::UNAVAILABLE);
    EXPECT_EQ(orchestrator_->getDiskStats(testDir_.string()).status, DiskStatus::AVAILABLE);

    auto entries = orchestrator_->listDirectory((testDir_ / "src").string());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "b");

    EXPECT_TRUE(orchestrator_->createSandboxDirs((testDir_ / "sb" / "s").string(),
                                                 (testDir_ / "sb" / "d").string()).success);
    EXPECT_FALSE(orchestrator_->selectDirectory().has_value());
}

TEST_F(OrchestratorTest, SelectDirectoryUsesPicker) {
    createOrchestrator(std::make_shared<FixedPicker>(std::string("/home/user/Pictures")));
    EXPECT_EQ(orchestrator_->selectDirectory().value_or(""), "/home/user/Pictures");
}

TEST_F(OrchestratorTest, DevCommands) {
    createOrchestrator();

    EXPECT_THROW(orchestrator_->simulateChurn(), ValidationError);
    DevSeedResult seeded = orchestrator_->seedDatabase();
    EXPECT_EQ(seeded.snapshotsCreated, 3u);
    EXPECT_EQ(orchestrator_->getDbStats().snapshotCount, 3u);

    orchestrator_->clearDevData();
    EXPECT_EQ(orchestrator_->getDbStats().snapshotCount, 0u);
}

TEST_F(OrchestratorTest, RequiresStoreAndDiskInspector) {
    EXPECT_THROW(Orchestrator(config_, std::make_shared<PosixProcessSpawner>(), nullptr,
                              std::make_shared<FilesystemDiskInspector>()),
                 std::invalid_argument);
}

TEST_F(OrchestratorTest, SavedJobsCarryStatusAndSchedule) {
    createOrchestrator();
    fs::create_directories(testDir_ / "dest");

    json payload = jobPayload("TIME_MACHINE");
    payload["schedule"] = {{"enabled", true}, {"intervalMinutes", 60}};
    Job saved = orchestrator_->saveJob(payload);
    EXPECT_EQ(saved.id, "j1");
    EXPECT_TRUE(JobStore::destinationHasJobConfig((testDir_ / "dest").string()));
    EXPECT_TRUE(orchestrator_->getNextRun("j1").has_value());

    ASSERT_TRUE(orchestrator_->runJob(payload).has_value());
    ASSERT_TRUE(nextTerminalEvent().has_value());
    ASSERT_TRUE(orchestrator_->waitForIdle(std::chrono::seconds(5)));

    auto overview = orchestrator_->getJobsWithStatus();
    ASSERT_EQ(overview.size(), 1u);
    EXPECT_EQ(overview[0].status, JobStatus::SUCCESS);
    EXPECT_TRUE(overview[0].mounted);
    EXPECT_EQ(overview[0].snapshotCount, 1u);
    EXPECT_TRUE(overview[0].lastRun.has_value());
    EXPECT_TRUE(overview[0].nextRun.has_value());

    EXPECT_TRUE(orchestrator_->deleteJob("j1"));
    EXPECT_TRUE(orchestrator_->getJobs().empty());
    EXPECT_FALSE(orchestrator_->getNextRun("j1").has_value());
}

TEST_F(OrchestratorTest, SavedJobsAreScheduledAfterRestart) {
    createOrchestrator();
    json payload = jobPayload("MIRROR");
    payload["schedule"] = {{"enabled", true}, {"intervalMinutes", 5}};
    orchestrator_->saveJob(payload);

    orchestrator_.reset();
    createOrchestrator();
    EXPECT_EQ(orchestrator_->getJobs().size(), 1u);
    EXPECT_TRUE(orchestrator_->getNextRun("j1").has_value());
}

TEST_F(OrchestratorTest, MountStartsRunOnMountJobs) {
    createOrchestrator();
    fs::create_directories(testDir_ / "dest");

    json payload = jobPayload("MIRROR");
    payload["schedule"] = {{"enabled", true}, {"runOnMount", true}};
    orchestrator_->saveJob(payload);

    EXPECT_TRUE(orchestrator_->handleVolumeMount((testDir_ / "elsewhere").string()).empty());
    auto started = orchestrator_->handleVolumeMount(testDir_.string());
    EXPECT_EQ(started, std::vector<std::string>{"j1"});

    auto event = nextTerminalEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEvent::Type::COMPLETED);
    EXPECT_TRUE(event->completion->success);
}

TEST_F(OrchestratorTest, ImportJobFromDestination) {
    createOrchestrator();
    fs::create_directories(testDir_ / "dest");
    orchestrator_->saveJob(jobPayload("ARCHIVE"));
    orchestrator_->deleteJob("j1");

    auto imported = orchestrator_->readJobFromDestination((testDir_ / "dest").string());
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->mode, SyncMode::ARCHIVE);
    EXPECT_FALSE(orchestrator_->readJobFromDestination((testDir_ / "src").string()).has_value());
}

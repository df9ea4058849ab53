#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "jobs/job_store.hpp"
#include "jobs/job_validator.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

class JobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = makeTestDir("amber_job_store_test");
        fs::create_directories(testDir_ / "dest");
        store_ = std::make_unique<JobStore>((testDir_ / "data").string());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    Job makeJob(const std::string& id) {
        Job job;
        job.id = id;
        job.name = "Job " + id;
        job.source = (testDir_ / "src").string();
        job.destination = (testDir_ / "dest").string();
        job.mode = SyncMode::TIME_MACHINE;
        job.excludePatterns = {"*.tmp"};
        return job;
    }

    fs::path testDir_;
    std::unique_ptr<JobStore> store_;
};

TEST_F(JobStoreTest, MissingFileMeansNoJobs) {
    EXPECT_TRUE(store_->loadJobs().empty());
    EXPECT_FALSE(store_->getJob("j1").has_value());
}

TEST_F(JobStoreTest, SaveAndLoadJob) {
    Job job = makeJob("j1");
    JobSchedule schedule;
    schedule.enabled = true;
    schedule.intervalMinutes = 60;
    schedule.runOnMount = true;
    job.schedule = schedule;
    store_->saveJob(job);

    auto jobs = store_->loadJobs();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].id, "j1");
    EXPECT_EQ(jobs[0].name, "Job j1");
    EXPECT_EQ(jobs[0].mode, SyncMode::TIME_MACHINE);
    EXPECT_EQ(jobs[0].excludePatterns, std::vector<std::string>{"*.tmp"});
    ASSERT_TRUE(jobs[0].schedule.has_value());
    EXPECT_TRUE(jobs[0].schedule->enabled);
    EXPECT_EQ(jobs[0].schedule->intervalMinutes, 60);
    EXPECT_TRUE(jobs[0].schedule->runOnMount);
}

TEST_F(JobStoreTest, SaveReplacesJobWithSameId) {
    store_->saveJob(makeJob("j1"));
    store_->saveJob(makeJob("j2"));

    Job renamed = makeJob("j1");
    renamed.name = "Renamed";
    store_->saveJob(renamed);

    auto jobs = store_->loadJobs();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(store_->getJob("j1")->name, "Renamed");
    EXPECT_EQ(store_->getJob("j2")->name, "Job j2");
}

TEST_F(JobStoreTest, DeleteJob) {
    store_->saveJob(makeJob("j1"));
    store_->saveJob(makeJob("j2"));

    EXPECT_TRUE(store_->deleteJob("j1"));
    EXPECT_FALSE(store_->deleteJob("j1"));
    auto jobs = store_->loadJobs();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].id, "j2");
}

TEST_F(JobStoreTest, InvalidJobIsNotSaved) {
    Job job = makeJob("../escape");
    EXPECT_THROW(store_->saveJob(job), ValidationError);
    EXPECT_FALSE(fs::exists(store_->jobsPath()));
}

TEST_F(JobStoreTest, CorruptFileIsMovedAside) {
    writeTextFile(store_->jobsPath(), "{ not json");

    EXPECT_THROW(store_->loadJobs(), JobStoreError);
    EXPECT_FALSE(fs::exists(store_->jobsPath()));

    bool backupFound = false;
    for (const auto& entry : fs::directory_iterator(testDir_ / "data")) {
        if (entry.path().filename().string().rfind("jobs.json.corrupt-", 0) == 0) {
            backupFound = true;
        }
    }
    EXPECT_TRUE(backupFound);

    // The store is usable again after the corrupt file moved.
    store_->saveJob(makeJob("j1"));
    EXPECT_EQ(store_->loadJobs().size(), 1u);
}

TEST_F(JobStoreTest, JobsFileIsOwnerOnly) {
    store_->saveJob(makeJob("j1"));
    auto perms = fs::status(store_->jobsPath()).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(JobStoreTest, DestinationConfigTravelsWithDrive) {
    Job job = makeJob("j1");
    EXPECT_FALSE(JobStore::destinationHasJobConfig(job.destination));
    EXPECT_FALSE(JobStore::readJobFromDestination(job.destination).has_value());

    ASSERT_TRUE(store_->writeJobToDestination(job)) << store_->getLastError();
    EXPECT_TRUE(JobStore::destinationHasJobConfig(job.destination));
    EXPECT_TRUE(fs::exists(testDir_ / "dest" / ".amber-meta" / "job.json"));

    auto read = JobStore::readJobFromDestination(job.destination);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->id, "j1");
    EXPECT_EQ(read->source, job.source);
}

TEST_F(JobStoreTest, UnreachableDestinationIsReported) {
    Job job = makeJob("j1");
    job.destination = (testDir_ / "unmounted").string();
    EXPECT_FALSE(store_->writeJobToDestination(job));
    EXPECT_NE(store_->getLastError().find("not accessible"), std::string::npos);
}

TEST_F(JobStoreTest, InvalidDestinationConfigThrows) {
    writeTextFile(testDir_ / "dest" / ".amber-meta" / "job.json", "{\"id\": 3}");
    EXPECT_THROW(JobStore::readJobFromDestination((testDir_ / "dest").string()), JobStoreError);
}

TEST_F(JobStoreTest, ScheduleIntervalAliasIsAccepted) {
    json payload = {
        {"id", "j1"},
        {"sourcePath", "/tmp/src"},
        {"destPath", "/tmp/dst"},
        {"mode", "MIRROR"},
        {"scheduleInterval", 1440}
    };
    Job job = JobValidator::fromJson(payload);
    ASSERT_TRUE(job.schedule.has_value());
    EXPECT_TRUE(job.schedule->enabled);
    EXPECT_EQ(job.schedule->intervalMinutes, 1440);

    payload["scheduleInterval"] = -5;
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);
    payload["scheduleInterval"] = "daily";
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);
}

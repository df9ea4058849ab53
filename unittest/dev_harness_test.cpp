#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "dev/dev_harness.hpp"
#include "history/snapshot_store.hpp"
#include "test_helpers.hpp"

class DevHarnessTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = makeTestDir("amber_dev_test");
        store_ = std::make_shared<SnapshotStore>((testDir_ / "index.db").string());

        options_.playgroundDir = (testDir_ / "playground").string();
        options_.seedFileCount = 60;
        options_.seedSnapshots = 3;
        options_.churnAdd = 5;
        options_.churnModify = 3;
        options_.churnDelete = 2;
        options_.churnMinFiles = 10;
        options_.benchmarkIterations = 3;
        harness_ = std::make_unique<DevHarness>(store_, options_);
    }

    void TearDown() override {
        harness_.reset();
        store_.reset();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    fs::path testDir_;
    DevHarnessOptions options_;
    std::shared_ptr<SnapshotStore> store_;
    std::unique_ptr<DevHarness> harness_;
};

TEST_F(DevHarnessTest, RequiresPlayground) {
    DevHarnessOptions options;
    EXPECT_THROW(DevHarness(store_, options), ValidationError);
}

TEST_F(DevHarnessTest, SeedCreatesSnapshots) {
    EXPECT_FALSE(harness_->isSeeded());
    DevSeedResult result = harness_->seed();
    EXPECT_EQ(result.jobsCreated, 1u);
    EXPECT_EQ(result.snapshotsCreated, 3u);
    EXPECT_EQ(result.filesCreated, 60u);
    EXPECT_GT(result.totalSizeBytes, 0u);
    EXPECT_TRUE(harness_->isSeeded());

    auto snapshots = store_->query(DevHarness::JOB_ID);
    ASSERT_EQ(snapshots.size(), 3u);
    EXPECT_LT(snapshots[2].createdAt, snapshots[1].createdAt);
    EXPECT_LT(snapshots[1].createdAt, snapshots[0].createdAt);
    EXPECT_EQ(snapshots[2].fileCount, 60u);
    EXPECT_TRUE(fs::is_directory(harness_->sourceDir()));
    EXPECT_TRUE(store_->verifyIndex());
}

TEST_F(DevHarnessTest, SeedIsIdempotent) {
    harness_->seed();
    DevSeedResult second = harness_->seed();
    EXPECT_EQ(second.snapshotsCreated, 0u);
    EXPECT_EQ(second.filesCreated, 0u);
    EXPECT_EQ(store_->query(DevHarness::JOB_ID).size(), 3u);
}

TEST_F(DevHarnessTest, ChurnRecordsNewSnapshot) {
    EXPECT_THROW(harness_->simulateChurn(), ValidationError);
    harness_->seed();

    DevChurnResult churn = harness_->simulateChurn();
    EXPECT_EQ(churn.added, 5u);
    EXPECT_EQ(churn.modified, 3u);
    EXPECT_EQ(churn.deleted, 2u);
    EXPECT_EQ(store_->query(DevHarness::JOB_ID).size(), 4u);
}

TEST_F(DevHarnessTest, BenchmarksRunAfterSeeding) {
    EXPECT_THROW(harness_->benchmarkOperation("fts_search"), ValidationError);
    harness_->seed();

    DevBenchmarkResult result = harness_->benchmarkOperation("fts_search");
    EXPECT_EQ(result.operation, "fts_search");
    EXPECT_EQ(result.iterations, 3u);
    EXPECT_LE(result.minMs, result.avgMs);
    EXPECT_LE(result.avgMs, result.maxMs);

    auto all = harness_->benchmarkAll();
    EXPECT_EQ(all.size(), DevHarness::benchmarkNames().size());
    EXPECT_THROW(harness_->benchmarkOperation("no_such_benchmark"), ValidationError);
}

TEST_F(DevHarnessTest, ReadmeSearchHitsEverySnapshot) {
    harness_->seed();
    auto matches = store_->searchPaths("readme", std::string(DevHarness::JOB_ID));
    EXPECT_EQ(matches.size(), 3u);
}

TEST_F(DevHarnessTest, StatsAndClear) {
    harness_->seed();
    DevDbStats stats = harness_->getDbStats();
    EXPECT_EQ(stats.snapshotCount, 3u);
    EXPECT_EQ(stats.ftsIndexEntries, stats.fileCount);
    EXPECT_GT(stats.dbSizeBytes, 0u);

    harness_->clear();
    EXPECT_FALSE(harness_->isSeeded());
    EXPECT_FALSE(fs::exists(harness_->sourceDir()));
    EXPECT_EQ(harness_->getDbStats().snapshotCount, 0u);
}

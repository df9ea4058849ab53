#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "history/snapshot_scanner.hpp"
#include "history/snapshot_store.hpp"
#include "test_helpers.hpp"

class SnapshotStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = makeTestDir("amber_store_test");
        dbPath_ = (testDir_ / "history" / "index.db").string();
        store_ = std::make_unique<SnapshotStore>(dbPath_);
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    JobRun successfulRun(const std::string& jobId, int64_t endedAt) {
        JobRun run;
        run.jobId = jobId;
        run.runId = "run-" + std::to_string(endedAt);
        run.mode = SyncMode::TIME_MACHINE;
        run.status = JobStatus::SUCCESS;
        run.startedAt = endedAt - 1000;
        run.endedAt = endedAt;
        return run;
    }

    Snapshot commit(const std::string& jobId, int64_t endedAt, const FileIndex& files) {
        return store_->commit(successfulRun(jobId, endedAt), files, "/backups/" + jobId + "/" + std::to_string(endedAt));
    }

    fs::path testDir_;
    std::string dbPath_;
    std::unique_ptr<SnapshotStore> store_;
};

TEST_F(SnapshotStoreTest, CommitAndSearchByFileName) {
    Snapshot snapshot = commit("j1", 1700000000000, {{"/a.txt", 10}, {"/b/c.txt", 20}});
    EXPECT_GT(snapshot.snapshotId, 0);
    EXPECT_EQ(snapshot.fileCount, 2u);
    EXPECT_EQ(snapshot.totalSizeBytes, 30u);
    EXPECT_EQ(snapshot.createdAt, 1700000000000);
    EXPECT_EQ(snapshot.indexDigest.size(), 64u);

    auto matches = store_->searchPaths("c.txt");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].snapshot.snapshotId, snapshot.snapshotId);
    ASSERT_EQ(matches[0].paths.size(), 1u);
    EXPECT_EQ(matches[0].paths[0], "/b/c.txt");
}

TEST_F(SnapshotStoreTest, SearchIsCaseInsensitiveAndHandlesShortPatterns) {
    commit("j1", 1700000000000, {{"/docs/README.md", 1}, {"/src/main.cpp", 2}, {"/x_y.txt", 3}});

    auto matches = store_->searchPaths("readme");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].paths[0], "/docs/README.md");

    matches = store_->searchPaths("c/");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].paths[0], "/src/main.cpp");

    // '_' is literal, not a LIKE wildcard.
    matches = store_->searchPaths("_y");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].paths[0], "/x_y.txt");

    EXPECT_TRUE(store_->searchPaths("zzz").empty());
    EXPECT_TRUE(store_->searchPaths("").empty());
}

TEST_F(SnapshotStoreTest, SearchGroupsNewestFirstAndRespectsFilters) {
    Snapshot older = commit("j1", 1000, {{"/report.pdf", 1}});
    Snapshot newer = commit("j1", 2000, {{"/report.pdf", 1}, {"/old/report.pdf", 1}});
    commit("j2", 3000, {{"/report.pdf", 1}});

    auto matches = store_->searchPaths("report", std::string("j1"));
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].snapshot.snapshotId, newer.snapshotId);
    EXPECT_EQ(matches[0].paths.size(), 2u);
    EXPECT_EQ(matches[1].snapshot.snapshotId, older.snapshotId);

    EXPECT_EQ(store_->searchPaths("report").size(), 3u);

    auto limited = store_->searchPaths("report", std::string("j1"), 2);
    size_t paths = 0;
    for (const auto& match : limited) {
        paths += match.paths.size();
    }
    EXPECT_EQ(paths, 2u);
    EXPECT_TRUE(store_->searchPaths("report", std::nullopt, 0).empty());
}

TEST_F(SnapshotStoreTest, QueryOrdersNewestFirstWithinRange) {
    commit("j1", 1000, {{"/a", 1}});
    commit("j1", 2000, {{"/a", 1}});
    commit("j1", 3000, {{"/a", 1}});
    commit("other", 2500, {{"/a", 1}});

    auto all = store_->query("j1");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].createdAt, 3000);
    EXPECT_EQ(all[2].createdAt, 1000);

    auto ranged = store_->query("j1", TimeRange{1500, 3000});
    ASSERT_EQ(ranged.size(), 2u);
    EXPECT_EQ(ranged[0].createdAt, 3000);
    EXPECT_EQ(ranged[1].createdAt, 2000);

    EXPECT_TRUE(store_->query("missing").empty());
}

TEST_F(SnapshotStoreTest, CreatedAtIsStrictlyIncreasingPerJob) {
    Snapshot first = commit("j1", 5000, {{"/a", 1}});
    Snapshot second = commit("j1", 5000, {{"/a", 1}});
    Snapshot third = commit("j1", 4000, {{"/a", 1}});
    EXPECT_EQ(first.createdAt, 5000);
    EXPECT_EQ(second.createdAt, 5001);
    EXPECT_EQ(third.createdAt, 5002);
}

TEST_F(SnapshotStoreTest, CommitNormalizesAndDeduplicatesPaths) {
    Snapshot snapshot = commit("j1", 1000, {{"a.txt", 1}, {"/a.txt", 5}, {"/", 0}, {"dir/b", 2}});
    EXPECT_EQ(snapshot.fileCount, 2u);

    FileIndex files = store_->snapshotFiles(snapshot.snapshotId);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, "/a.txt");
    EXPECT_EQ(files[0].size, 1u);
    EXPECT_EQ(files[1].path, "/dir/b");
}

TEST_F(SnapshotStoreTest, RejectsInvalidCommits) {
    JobRun failed = successfulRun("j1", 1000);
    failed.status = JobStatus::FAILED;
    EXPECT_THROW(store_->commit(failed, {{"/a", 1}}, "/root"), InvalidCommitError);

    JobRun mirror = successfulRun("j1", 1000);
    mirror.mode = SyncMode::MIRROR;
    EXPECT_THROW(store_->commit(mirror, {{"/a", 1}}, "/root"), InvalidCommitError);

    EXPECT_TRUE(store_->query("j1").empty());
}

TEST_F(SnapshotStoreTest, SnapshotsAreImmutable) {
    Snapshot snapshot = commit("j1", 1000, {{"/a", 1}});
    store_.reset();

    SqliteDatabase db(dbPath_);
    EXPECT_THROW(db.exec("UPDATE snapshots SET file_count = 99 WHERE id = " + std::to_string(snapshot.snapshotId)),
                 StoreError);
    EXPECT_THROW(db.exec("UPDATE files SET size = 99"), StoreError);
}

TEST_F(SnapshotStoreTest, DigestDependsOnPathSetOnly) {
    std::string a = SnapshotStore::computeDigest({{"/b", 1}, {"/a", 2}});
    std::string b = SnapshotStore::computeDigest({{"/a", 7}, {"/b", 9}});
    std::string c = SnapshotStore::computeDigest({{"/a", 1}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    // SHA-256 of the empty input.
    EXPECT_EQ(SnapshotStore::computeDigest({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(SnapshotStoreTest, StatsCountEverything) {
    commit("j1", 1000, {{"/a", 10}, {"/b", 20}});
    commit("j2", 1000, {{"/c", 5}});

    HistoryStats stats = store_->stats();
    EXPECT_EQ(stats.snapshotCount, 2u);
    EXPECT_EQ(stats.fileCount, 3u);
    EXPECT_EQ(stats.totalSizeBytes, 35u);
    EXPECT_EQ(stats.indexEntryCount, 3u);
    EXPECT_GT(stats.storageSizeBytes, 0u);
}

TEST_F(SnapshotStoreTest, PruneKeepsNewest) {
    commit("j1", 1000, {{"/old", 1}});
    commit("j1", 2000, {{"/mid", 1}});
    Snapshot newest = commit("j1", 3000, {{"/new", 1}});
    commit("j2", 1000, {{"/other", 1}});

    EXPECT_EQ(store_->pruneRetention("j1", 1), 2u);
    auto remaining = store_->query("j1");
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].snapshotId, newest.snapshotId);
    EXPECT_TRUE(store_->searchPaths("old").empty());
    EXPECT_EQ(store_->query("j2").size(), 1u);
    EXPECT_TRUE(store_->verifyIndex());

    EXPECT_EQ(store_->pruneRetention("j1", 5), 0u);
    EXPECT_EQ(store_->pruneRetention("j1", 0), 1u);
    EXPECT_TRUE(store_->query("j1").empty());
}

TEST_F(SnapshotStoreTest, RebuildKeepsSearchResults) {
    commit("j1", 1000, {{"/photos/cat.jpg", 1}, {"/photos/dog.jpg", 1}});
    commit("j1", 2000, {{"/photos/cat.jpg", 1}});

    auto before = store_->searchPaths("cat");
    store_->rebuildIndex();
    auto after = store_->searchPaths("cat");

    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].snapshot.snapshotId, after[i].snapshot.snapshotId);
        EXPECT_EQ(before[i].paths, after[i].paths);
    }
    EXPECT_TRUE(store_->verifyIndex());
}

TEST_F(SnapshotStoreTest, VerifyDetectsMissingIndexEntries) {
    commit("j1", 1000, {{"/a.txt", 1}, {"/b.txt", 1}});
    EXPECT_TRUE(store_->verifyIndex());

    {
        SqliteDatabase db(dbPath_);
        db.exec("INSERT INTO files_fts(files_fts, rowid, path, name) "
                "SELECT 'delete', id, path, name FROM files WHERE path = '/a.txt'");
    }
    EXPECT_FALSE(store_->verifyIndex());

    store_->rebuildIndex();
    EXPECT_TRUE(store_->verifyIndex());
}

TEST_F(SnapshotStoreTest, VerifyDetectsDigestMismatch) {
    commit("j1", 1000, {{"/a.txt", 1}, {"/b.txt", 1}});
    {
        SqliteDatabase db(dbPath_);
        db.exec("DELETE FROM files WHERE path = '/b.txt'");
    }
    EXPECT_FALSE(store_->verifyIndex());
}

TEST_F(SnapshotStoreTest, ReopenKeepsHistory) {
    Snapshot snapshot = commit("j1", 1000, {{"/a.txt", 1}});
    store_ = std::make_unique<SnapshotStore>(dbPath_);

    auto loaded = store_->getSnapshot(snapshot.snapshotId);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->indexDigest, snapshot.indexDigest);
    EXPECT_EQ(loaded->rootPath, snapshot.rootPath);
    EXPECT_FALSE(store_->getSnapshot(snapshot.snapshotId + 100).has_value());

    SqliteDatabase db(dbPath_, SqliteDatabase::Mode::READ_ONLY);
    EXPECT_EQ(db.userVersion(), SnapshotStore::SCHEMA_VERSION);
}

TEST_F(SnapshotStoreTest, CompactKeepsData) {
    commit("j1", 1000, {{"/a.txt", 1}});
    commit("j1", 2000, {{"/a.txt", 1}});
    store_->pruneRetention("j1", 1);
    store_->compact();
    EXPECT_EQ(store_->query("j1").size(), 1u);
    EXPECT_TRUE(store_->verifyIndex());
}

TEST_F(SnapshotStoreTest, ScannerIndexesFilesAndSymlinks) {
    fs::path root = testDir_ / "snapshot";
    writeTextFile(root / "a.txt", "12345");
    writeTextFile(root / "b" / "c.txt", "xy");
    fs::create_directories(root / "empty");
    fs::create_symlink("a.txt", root / "link");

    SnapshotScanner scanner;
    FileIndex files;
    ASSERT_TRUE(scanner.scan(root.string(), files)) << scanner.getLastError();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].path, "/a.txt");
    EXPECT_EQ(files[0].size, 5u);
    EXPECT_EQ(files[1].path, "/b/c.txt");
    EXPECT_EQ(files[2].path, "/link");
    EXPECT_EQ(files[2].size, 0u);

    EXPECT_FALSE(scanner.scan((testDir_ / "missing").string(), files));
    EXPECT_FALSE(scanner.getLastError().empty());
}

#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "jobs/job_validator.hpp"

using json = nlohmann::json;

class JobValidatorTest : public ::testing::Test {
protected:
    json validPayload() {
        return json{
            {"id", "docs-backup"},
            {"name", "Documents"},
            {"source", "/home/user/Documents"},
            {"destination", "/mnt/backup/docs"},
            {"mode", "TIME_MACHINE"},
            {"excludePatterns", {"*.tmp", "node_modules/"}}
        };
    }
};

TEST_F(JobValidatorTest, AcceptsCompletePayload) {
    Job job = JobValidator::fromJson(validPayload());
    EXPECT_EQ(job.id, "docs-backup");
    EXPECT_EQ(job.name, "Documents");
    EXPECT_EQ(job.source, "/home/user/Documents");
    EXPECT_EQ(job.destination, "/mnt/backup/docs");
    EXPECT_EQ(job.mode, SyncMode::TIME_MACHINE);
    ASSERT_EQ(job.excludePatterns.size(), 2u);
    EXPECT_EQ(job.excludePatterns[1], "node_modules/");
}

TEST_F(JobValidatorTest, AcceptsAliasesAndCamelCaseMode) {
    json payload = {
        {"id", "j1"},
        {"sourcePath", "/src"},
        {"destPath", "/dst"},
        {"mode", "timeMachine"}
    };
    Job job = JobValidator::fromJson(payload);
    EXPECT_EQ(job.source, "/src");
    EXPECT_EQ(job.destination, "/dst");
    EXPECT_EQ(job.mode, SyncMode::TIME_MACHINE);
    EXPECT_EQ(job.name, "j1");
    EXPECT_TRUE(job.excludePatterns.empty());
}

TEST_F(JobValidatorTest, RejectsMissingFields) {
    for (const char* key : {"id", "source", "destination", "mode"}) {
        json payload = validPayload();
        payload.erase(key);
        EXPECT_THROW(JobValidator::fromJson(payload), ValidationError) << "without " << key;
    }
}

TEST_F(JobValidatorTest, RejectsWrongTypes) {
    json payload = validPayload();
    payload["source"] = 42;
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);

    payload = validPayload();
    payload["excludePatterns"] = "*.tmp";
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);

    payload = validPayload();
    payload["excludePatterns"] = json::array({"*.tmp", 3});
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);

    EXPECT_THROW(JobValidator::fromJson(json::array()), ValidationError);
}

TEST_F(JobValidatorTest, RejectsUnknownMode) {
    json payload = validPayload();
    payload["mode"] = "incremental";
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);
}

TEST_F(JobValidatorTest, RejectsEmptyPaths) {
    json payload = validPayload();
    payload["destination"] = "";
    EXPECT_THROW(JobValidator::fromJson(payload), ValidationError);
}

TEST_F(JobValidatorTest, RejectsMalformedJsonText) {
    EXPECT_THROW(JobValidator::fromString("{\"id\": "), ValidationError);
    Job job = JobValidator::fromString(validPayload().dump());
    EXPECT_EQ(job.id, "docs-backup");
}

TEST_F(JobValidatorTest, JobIdRules) {
    EXPECT_TRUE(JobValidator::isValidJobId("dev-backup"));
    EXPECT_TRUE(JobValidator::isValidJobId("Job_1.daily"));
    EXPECT_FALSE(JobValidator::isValidJobId(""));
    EXPECT_FALSE(JobValidator::isValidJobId("a/b"));
    EXPECT_FALSE(JobValidator::isValidJobId("a..b"));
    EXPECT_FALSE(JobValidator::isValidJobId("has space"));
    EXPECT_FALSE(JobValidator::isValidJobId(std::string(JobValidator::MAX_JOB_ID_LENGTH + 1, 'x')));
}

TEST_F(JobValidatorTest, ParsesSyncModeNames) {
    SyncMode mode = SyncMode::ARCHIVE;
    EXPECT_TRUE(parseSyncMode("mirror", mode));
    EXPECT_EQ(mode, SyncMode::MIRROR);
    EXPECT_TRUE(parseSyncMode("time-machine", mode));
    EXPECT_EQ(mode, SyncMode::TIME_MACHINE);
    EXPECT_TRUE(parseSyncMode("CLOUD", mode));
    EXPECT_EQ(mode, SyncMode::CLOUD);
    EXPECT_FALSE(parseSyncMode("snapshot", mode));
    EXPECT_EQ(mode, SyncMode::CLOUD);
}

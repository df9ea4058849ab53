#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "jobs/job_run.hpp"

class JobRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_.id = "j1";
        job_.name = "Documents";
        job_.source = "/home/user/Documents";
        job_.destination = "/mnt/backup";
        job_.mode = SyncMode::MIRROR;
    }

    LogLine makeLog(const std::string& message) {
        LogLine line;
        line.jobId = job_.id;
        line.runId = "run-1";
        line.message = message;
        return line;
    }

    Job job_;
};

TEST_F(JobRunTest, StartsIdle) {
    JobRunStateMachine machine(job_);
    EXPECT_EQ(machine.status(), JobStatus::IDLE);
    EXPECT_FALSE(machine.isRunning());
    EXPECT_FALSE(machine.lastProgress().has_value());
    EXPECT_EQ(machine.run().jobId, "j1");
}

TEST_F(JobRunTest, StartMovesToRunning) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");

    JobRun run = machine.run();
    EXPECT_EQ(run.status, JobStatus::RUNNING);
    EXPECT_EQ(run.runId, "run-1");
    EXPECT_EQ(run.mode, SyncMode::MIRROR);
    EXPECT_GT(run.startedAt, 0);
    EXPECT_FALSE(run.endedAt.has_value());
}

TEST_F(JobRunTest, SecondStartWhileRunningThrows) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");
    EXPECT_THROW(machine.requestStart("run-2"), JobAlreadyRunningError);
    EXPECT_EQ(machine.run().runId, "run-1");
}

TEST_F(JobRunTest, SuccessfulCompletion) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");
    EXPECT_TRUE(machine.onComplete(true, std::nullopt, JobErrorCode::NONE));

    JobRun run = machine.run();
    EXPECT_EQ(run.status, JobStatus::SUCCESS);
    EXPECT_TRUE(run.isTerminal());
    EXPECT_TRUE(run.endedAt.has_value());
    EXPECT_FALSE(run.error.has_value());
}

TEST_F(JobRunTest, FailedCompletionKeepsReason) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");
    EXPECT_TRUE(machine.onComplete(false, std::string("rsync exited with code 23"), JobErrorCode::NON_ZERO_EXIT));

    JobRun run = machine.run();
    EXPECT_EQ(run.status, JobStatus::FAILED);
    EXPECT_EQ(run.error.value_or(""), "rsync exited with code 23");
    EXPECT_EQ(run.errorCode, JobErrorCode::NON_ZERO_EXIT);
}

TEST_F(JobRunTest, KillWinsOverLateCompletion) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");
    EXPECT_TRUE(machine.requestKill());
    EXPECT_FALSE(machine.onComplete(true, std::nullopt, JobErrorCode::NONE));

    JobRun run = machine.run();
    EXPECT_EQ(run.status, JobStatus::FAILED);
    EXPECT_EQ(run.errorCode, JobErrorCode::CANCELLED);
    EXPECT_EQ(run.error.value_or(""), "cancelled");
}

TEST_F(JobRunTest, KillWhenNotRunningIsNoop) {
    JobRunStateMachine machine(job_);
    EXPECT_FALSE(machine.requestKill());
    EXPECT_EQ(machine.status(), JobStatus::IDLE);
}

TEST_F(JobRunTest, RestartAfterTerminalState) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");
    machine.onLog(makeLog("first run"));
    machine.onComplete(false, std::string("boom"), JobErrorCode::IO_ERROR);

    machine.requestStart("run-2");
    JobRun run = machine.run();
    EXPECT_EQ(run.status, JobStatus::RUNNING);
    EXPECT_EQ(run.runId, "run-2");
    EXPECT_FALSE(run.error.has_value());
    EXPECT_EQ(run.errorCode, JobErrorCode::NONE);
    EXPECT_TRUE(machine.recentLogs().empty());
}

TEST_F(JobRunTest, TracksLastProgress) {
    JobRunStateMachine machine(job_);
    machine.requestStart("run-1");

    ProgressEvent first;
    first.percentage = 10.0;
    ProgressEvent second;
    second.percentage = 55.0;
    machine.onProgress(first);
    machine.onProgress(second);

    ASSERT_TRUE(machine.lastProgress().has_value());
    EXPECT_DOUBLE_EQ(machine.lastProgress()->percentage, 55.0);
    EXPECT_GE(machine.lastActivityAt(), machine.run().startedAt);
}

TEST_F(JobRunTest, LogBufferKeepsNewestLines) {
    JobRunStateMachine machine(job_, 3);
    machine.requestStart("run-1");
    for (int i = 0; i < 5; ++i) {
        machine.onLog(makeLog("line " + std::to_string(i)));
    }

    auto logs = machine.recentLogs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs.front().message, "line 2");
    EXPECT_EQ(logs.back().message, "line 4");
}

TEST_F(JobRunTest, RingBufferWithZeroCapacityHoldsOneLine) {
    LogRingBuffer buffer(0);
    EXPECT_EQ(buffer.capacity(), 1u);
    buffer.push(makeLog("a"));
    buffer.push(makeLog("b"));
    ASSERT_EQ(buffer.size(), 1u);
    EXPECT_EQ(buffer.lines()[0].message, "b");
}

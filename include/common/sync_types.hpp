#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class SyncMode {
    MIRROR,
    ARCHIVE,
    TIME_MACHINE,
    CLOUD
};

enum class JobStatus {
    IDLE,
    RUNNING,
    SUCCESS,
    FAILED
};

// Closed classification of why a start was rejected or a run failed.
enum class JobErrorCode {
    NONE,
    VALIDATION_FAILED,
    ALREADY_RUNNING,
    SPAWN_FAILURE,
    NON_ZERO_EXIT,
    CANCELLED,
    IO_ERROR
};

enum class LogStream {
    STDOUT,
    STDERR,
    ENGINE
};

enum class DiskStatus {
    AVAILABLE,
    UNAVAILABLE
};

// Periodic trigger of a saved job.
struct JobSchedule {
    bool enabled{false};
    int64_t intervalMinutes{0};   // 0 means no periodic runs
    bool runOnMount{false};       // run when the destination volume appears
};

// Source to destination configuration. Never mutated once validated.
struct Job {
    std::string id;
    std::string name;
    std::string source;
    std::string destination;
    SyncMode mode{SyncMode::ARCHIVE};
    std::vector<std::string> excludePatterns;
    std::optional<JobSchedule> schedule;
};

struct JobRun {
    std::string jobId;
    std::string runId;
    SyncMode mode{SyncMode::ARCHIVE};
    JobStatus status{JobStatus::IDLE};
    int64_t startedAt{0};                // Unix milliseconds
    std::optional<int64_t> endedAt;
    std::optional<std::string> error;
    JobErrorCode errorCode{JobErrorCode::NONE};

    bool isTerminal() const {
        return status == JobStatus::SUCCESS || status == JobStatus::FAILED;
    }
};

struct ProgressEvent {
    std::string jobId;
    std::string runId;
    uint64_t transferredBytes{0};
    double percentage{0.0};              // always within [0, 100]
    std::optional<double> speedBytesPerSec;
    std::optional<int64_t> etaSeconds;
    std::optional<std::string> currentFile;
};

struct LogLine {
    std::string jobId;
    std::string runId;
    int64_t timestamp{0};
    LogStream stream{LogStream::STDOUT};
    std::string message;
};

struct CompletionEvent {
    std::string jobId;
    std::string runId;
    bool success{false};
    std::optional<std::string> error;
    JobErrorCode errorCode{JobErrorCode::NONE};
};

struct DiskStats {
    std::string path;
    uint64_t total{0};
    uint64_t free{0};
    DiskStatus status{DiskStatus::UNAVAILABLE};
};

struct IndexedFile {
    std::string path;
    uint64_t size{0};
};

using FileIndex = std::vector<IndexedFile>;

struct Snapshot {
    int64_t snapshotId{0};
    std::string jobId;
    std::string runId;
    int64_t createdAt{0};                // Unix milliseconds
    uint64_t fileCount{0};
    uint64_t totalSizeBytes{0};
    std::string rootPath;
    std::string indexDigest;             // hex SHA-256 of the sorted path set
};

// Inclusive on both ends, Unix milliseconds.
struct TimeRange {
    int64_t from{0};
    int64_t to{0};
};

int64_t nowMillis();

std::string toString(SyncMode mode);
std::string toString(JobStatus status);
std::string toString(JobErrorCode code);
std::string toString(LogStream stream);
std::string toString(DiskStatus status);

// Accepts the canonical names ("TIME_MACHINE") and the camelCase names used by job files ("timeMachine").
bool parseSyncMode(const std::string& text, SyncMode& mode);

void to_json(nlohmann::json& j, const JobSchedule& schedule);
void to_json(nlohmann::json& j, const Job& job);
void to_json(nlohmann::json& j, const JobRun& run);
void to_json(nlohmann::json& j, const ProgressEvent& event);
void to_json(nlohmann::json& j, const LogLine& line);
void to_json(nlohmann::json& j, const CompletionEvent& event);
void to_json(nlohmann::json& j, const DiskStats& stats);
void to_json(nlohmann::json& j, const Snapshot& snapshot);

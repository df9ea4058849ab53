#include "common/sync_types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

using json = nlohmann::json;

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string toString(SyncMode mode) {
    switch (mode) {
        case SyncMode::MIRROR:       return "MIRROR";
        case SyncMode::ARCHIVE:      return "ARCHIVE";
        case SyncMode::TIME_MACHINE: return "TIME_MACHINE";
        case SyncMode::CLOUD:        return "CLOUD";
    }
    return "UNKNOWN";
}

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::IDLE:    return "IDLE";
        case JobStatus::RUNNING: return "RUNNING";
        case JobStatus::SUCCESS: return "SUCCESS";
        case JobStatus::FAILED:  return "FAILED";
    }
    return "UNKNOWN";
}

std::string toString(JobErrorCode code) {
    switch (code) {
        case JobErrorCode::NONE:              return "NONE";
        case JobErrorCode::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case JobErrorCode::ALREADY_RUNNING:   return "ALREADY_RUNNING";
        case JobErrorCode::SPAWN_FAILURE:     return "SPAWN_FAILURE";
        case JobErrorCode::NON_ZERO_EXIT:     return "NON_ZERO_EXIT";
        case JobErrorCode::CANCELLED:         return "CANCELLED";
        case JobErrorCode::IO_ERROR:          return "IO_ERROR";
    }
    return "UNKNOWN";
}

std::string toString(LogStream stream) {
    switch (stream) {
        case LogStream::STDOUT: return "stdout";
        case LogStream::STDERR: return "stderr";
        case LogStream::ENGINE: return "engine";
    }
    return "unknown";
}

std::string toString(DiskStatus status) {
    return status == DiskStatus::AVAILABLE ? "AVAILABLE" : "UNAVAILABLE";
}

bool parseSyncMode(const std::string& text, SyncMode& mode) {
    std::string key;
    for (char c : text) {
        if (c == '_' || c == '-') {
            continue;
        }
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (key == "mirror") {
        mode = SyncMode::MIRROR;
    } else if (key == "archive") {
        mode = SyncMode::ARCHIVE;
    } else if (key == "timemachine") {
        mode = SyncMode::TIME_MACHINE;
    } else if (key == "cloud") {
        mode = SyncMode::CLOUD;
    } else {
        return false;
    }
    return true;
}

void to_json(json& j, const JobSchedule& schedule) {
    j = json{
        {"enabled", schedule.enabled},
        {"intervalMinutes", schedule.intervalMinutes},
        {"runOnMount", schedule.runOnMount}
    };
}

void to_json(json& j, const Job& job) {
    j = json{
        {"id", job.id},
        {"name", job.name},
        {"source", job.source},
        {"destination", job.destination},
        {"mode", toString(job.mode)},
        {"excludePatterns", job.excludePatterns}
    };
    j["schedule"] = job.schedule ? json(*job.schedule) : json(nullptr);
}

void to_json(json& j, const JobRun& run) {
    j = json{
        {"jobId", run.jobId},
        {"runId", run.runId},
        {"mode", toString(run.mode)},
        {"status", toString(run.status)},
        {"startedAt", run.startedAt},
        {"errorCode", toString(run.errorCode)}
    };
    j["endedAt"] = run.endedAt ? json(*run.endedAt) : json(nullptr);
    j["error"] = run.error ? json(*run.error) : json(nullptr);
}

void to_json(json& j, const ProgressEvent& event) {
    j = json{
        {"jobId", event.jobId},
        {"runId", event.runId},
        {"transferred", event.transferredBytes},
        {"percentage", event.percentage}
    };
    j["speed"] = event.speedBytesPerSec ? json(*event.speedBytesPerSec) : json(nullptr);
    j["eta"] = event.etaSeconds ? json(*event.etaSeconds) : json(nullptr);
    j["currentFile"] = event.currentFile ? json(*event.currentFile) : json(nullptr);
}

void to_json(json& j, const LogLine& line) {
    j = json{
        {"jobId", line.jobId},
        {"runId", line.runId},
        {"timestamp", line.timestamp},
        {"stream", toString(line.stream)},
        {"message", line.message}
    };
}

void to_json(json& j, const CompletionEvent& event) {
    j = json{
        {"jobId", event.jobId},
        {"runId", event.runId},
        {"success", event.success},
        {"errorCode", toString(event.errorCode)}
    };
    j["error"] = event.error ? json(*event.error) : json(nullptr);
}

void to_json(json& j, const DiskStats& stats) {
    j = json{
        {"path", stats.path},
        {"total", stats.total},
        {"free", stats.free},
        {"status", toString(stats.status)}
    };
}

void to_json(json& j, const Snapshot& snapshot) {
    j = json{
        {"snapshotId", snapshot.snapshotId},
        {"jobId", snapshot.jobId},
        {"runId", snapshot.runId},
        {"createdAt", snapshot.createdAt},
        {"fileCount", snapshot.fileCount},
        {"totalSizeBytes", snapshot.totalSizeBytes},
        {"rootPath", snapshot.rootPath},
        {"indexDigest", snapshot.indexDigest}
    };
}

#pragma once

#include <stdexcept>
#include <string>

// Base of every error the engine throws across a component boundary.
class AmberError : public std::runtime_error {
public:
    explicit AmberError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed job payload or argument, rejected before it reaches the state machine.
class ValidationError : public AmberError {
public:
    explicit ValidationError(const std::string& message)
        : AmberError("Validation error: " + message) {}
};

// Transfer executable missing or source/destination unusable. The job keeps its prior state.
class ProcessSpawnError : public AmberError {
public:
    explicit ProcessSpawnError(const std::string& message)
        : AmberError("Failed to spawn transfer process: " + message) {}
};

class JobAlreadyRunningError : public AmberError {
public:
    explicit JobAlreadyRunningError(const std::string& jobId)
        : AmberError("Job already running: " + jobId)
        , jobId_(jobId) {}

    const std::string& jobId() const { return jobId_; }

private:
    std::string jobId_;
};

// Commit of a run that is not a successful TIME_MACHINE run.
class InvalidCommitError : public AmberError {
public:
    explicit InvalidCommitError(const std::string& message)
        : AmberError("Invalid snapshot commit: " + message) {}
};

class StoreError : public AmberError {
public:
    explicit StoreError(const std::string& message)
        : AmberError("Snapshot store error: " + message) {}
};

class ConfigError : public AmberError {
public:
    explicit ConfigError(const std::string& message)
        : AmberError("Configuration error: " + message) {}
};

// Unreadable or corrupt saved job configuration.
class JobStoreError : public AmberError {
public:
    explicit JobStoreError(const std::string& message)
        : AmberError("Job store error: " + message) {}
};

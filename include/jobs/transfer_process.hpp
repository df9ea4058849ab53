#pragma once

#include "common/sync_types.hpp"
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

struct OutputChunk {
    LogStream stream{LogStream::STDOUT};
    std::string data;
};

struct ProcessExit {
    bool exited{false};   // false when terminated by a signal
    int exitCode{-1};
    int signal{0};
};

// A spawned transfer process running in its own process group.
class TransferProcess {
public:
    virtual ~TransferProcess() = default;

    virtual pid_t pid() const = 0;

    // Blocks until either stream has output. Returns false once both streams
    // reached EOF. Throws std::system_error when reading fails.
    virtual bool readChunk(OutputChunk& chunk) = 0;

    // Signal the whole process group.
    virtual void terminate() = 0;
    virtual void forceKill() = 0;

    // Reaps the process. Call after readChunk returned false.
    virtual ProcessExit wait() = 0;
};

class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    // Throws ProcessSpawnError when the executable cannot be started.
    virtual std::unique_ptr<TransferProcess> spawn(const std::vector<std::string>& argv) = 0;
};

// fork/exec spawner with stdout and stderr captured through pipes.
class PosixProcessSpawner : public ProcessSpawner {
public:
    std::unique_ptr<TransferProcess> spawn(const std::vector<std::string>& argv) override;
};

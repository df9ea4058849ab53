#pragma once

#include "common/sync_types.hpp"
#include <cstdint>
#include <string>

// Builds the file index of a finished snapshot folder: regular files and
// symlinks, keyed by their path relative to the root with a leading '/'.
class SnapshotScanner {
public:
    bool scan(const std::string& root, FileIndex& files);

    std::string getLastError() const { return lastError_; }
    uint64_t getSkippedEntries() const { return skippedEntries_; }

private:
    std::string lastError_;
    uint64_t skippedEntries_{0};
};

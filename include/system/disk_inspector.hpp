#pragma once

#include "common/sync_types.hpp"
#include <string>

class DiskInspector {
public:
    virtual ~DiskInspector() = default;

    // Never throws. Any failure is reported as DiskStatus::UNAVAILABLE.
    virtual DiskStats stat(const std::string& path) = 0;
};

// Reads free and total space through std::filesystem::space.
class FilesystemDiskInspector : public DiskInspector {
public:
    DiskStats stat(const std::string& path) override;
};

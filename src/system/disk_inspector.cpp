#include "system/disk_inspector.hpp"
#include "common/logger.hpp"
#include <filesystem>

DiskStats FilesystemDiskInspector::stat(const std::string& path) {
    DiskStats stats;
    stats.path = path;

    if (path.empty()) {
        return stats;
    }

    try {
        std::error_code ec;
        std::filesystem::space_info info = std::filesystem::space(path, ec);
        if (ec) {
            Logger::debug("Disk stat for " + path + " failed: " + ec.message());
            return stats;
        }
        if (info.capacity == static_cast<std::uintmax_t>(-1) || info.available == static_cast<std::uintmax_t>(-1)) {
            return stats;
        }
        stats.total = static_cast<uint64_t>(info.capacity);
        stats.free = static_cast<uint64_t>(info.available);
        stats.status = DiskStatus::AVAILABLE;
    } catch (const std::exception& e) {
        Logger::debug("Disk stat for " + path + " failed: " + e.what());
        stats.total = 0;
        stats.free = 0;
        stats.status = DiskStatus::UNAVAILABLE;
    }
    return stats;
}

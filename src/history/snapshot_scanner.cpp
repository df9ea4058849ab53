#include "history/snapshot_scanner.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

bool SnapshotScanner::scan(const std::string& root, FileIndex& files) {
    lastError_.clear();
    skippedEntries_ = 0;
    files.clear();

    std::error_code ec;
    fs::path base(root);
    if (!fs::is_directory(base, ec)) {
        lastError_ = "snapshot root is not a directory: " + root;
        return false;
    }

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        lastError_ = "cannot open " + root + ": " + ec.message();
        return false;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code entryEc;
        fs::file_status status = it->symlink_status(entryEc);

        if (entryEc) {
            ++skippedEntries_;
        } else if (fs::is_symlink(status) || fs::is_regular_file(status)) {
            IndexedFile file;
            file.path = "/" + it->path().lexically_relative(base).generic_string();
            file.size = fs::is_symlink(status) ? 0 : it->file_size(entryEc);
            if (entryEc) {
                ++skippedEntries_;
            } else {
                files.push_back(file);
            }
        }

        it.increment(ec);
        if (ec) {
            lastError_ = "walking " + root + " failed: " + ec.message();
            return false;
        }
    }

    std::sort(files.begin(), files.end(), [](const IndexedFile& a, const IndexedFile& b) {
        return a.path < b.path;
    });

    if (skippedEntries_ > 0) {
        Logger::warning("Skipped " + std::to_string(skippedEntries_) + " unreadable entries under " + root);
    }
    return true;
}

#include "system/file_service.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

extern char** environ;

namespace {

int64_t toUnixMillis(fs::file_time_type time) {
    // file_time_type has an unspecified epoch in C++17; shift through the clocks' current values.
    auto systemNow = std::chrono::system_clock::now();
    auto fileNow = fs::file_time_type::clock::now();
    auto converted = systemNow + std::chrono::duration_cast<std::chrono::system_clock::duration>(time - fileNow);
    return std::chrono::duration_cast<std::chrono::milliseconds>(converted.time_since_epoch()).count();
}

} // namespace

void to_json(json& j, const DirectoryEntry& entry) {
    j = json{
        {"name", entry.name},
        {"path", entry.path},
        {"isDirectory", entry.isDirectory},
        {"size", entry.size},
        {"modified", entry.modified}
    };
}

void to_json(json& j, const SandboxResult& result) {
    j = json{{"success", result.success}};
    j["error"] = result.error ? json(*result.error) : json(nullptr);
}

FileService::FileService(const std::string& opener)
    : opener_(opener) {
}

std::vector<DirectoryEntry> FileService::listDirectory(const std::string& path) const {
    std::error_code ec;
    if (path.empty() || !fs::is_directory(path, ec)) {
        throw ValidationError("not a directory: " + path);
    }

    std::vector<DirectoryEntry> entries;
    fs::directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ValidationError("cannot read " + path + ": " + ec.message());
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entryEc;
        DirectoryEntry entry;
        entry.name = it->path().filename().string();
        entry.path = it->path().string();
        entry.isDirectory = it->is_directory(entryEc);
        if (!entry.isDirectory && it->is_regular_file(entryEc)) {
            entry.size = it->file_size(entryEc);
            if (entryEc) {
                entry.size = 0;
            }
        }
        auto modified = it->last_write_time(entryEc);
        entry.modified = entryEc ? 0 : toUnixMillis(modified);
        entries.push_back(entry);
    }
    if (ec) {
        Logger::warning("Listing " + path + " stopped early: " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        if (a.isDirectory != b.isDirectory) {
            return a.isDirectory;
        }
        return a.name < b.name;
    });
    return entries;
}

SandboxResult FileService::createSandboxDirs(const std::string& source, const std::string& destination) const {
    SandboxResult result;
    for (const auto& dir : {source, destination}) {
        if (dir.empty() || !fs::path(dir).is_absolute()) {
            result.error = "sandbox paths must be absolute: '" + dir + "'";
            return result;
        }
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            result.error = "cannot create " + dir + ": " + ec.message();
            return result;
        }
    }
    result.success = true;
    return result;
}

bool FileService::openPath(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        lastError_ = "path does not exist: " + path;
        return false;
    }
    return launchDetached({opener_, path});
}

bool FileService::revealInFileManager(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        lastError_ = "path does not exist: " + path;
        return false;
    }
    // No portable "select item" request on Linux; open the containing folder.
    fs::path target = fs::is_directory(path, ec) ? fs::path(path) : fs::path(path).parent_path();
    return launchDetached({opener_, target.string()});
}

bool FileService::launchDetached(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
    if (rc != 0) {
        lastError_ = "failed to launch " + argv[0] + ": " + std::strerror(rc);
        Logger::error(lastError_);
        return false;
    }

    // Reap in the background so the opener never lingers as a zombie.
    std::thread([pid]() {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }).detach();

    lastError_.clear();
    return true;
}

#include "jobs/transfer_command.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char* const LATEST_LINK = "latest";

std::string trimmed(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string withTrailingSlash(const std::string& path) {
    if (!path.empty() && path.back() == '/') {
        return path;
    }
    return path + "/";
}

std::string quoteIfNeeded(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"'\\$") == std::string::npos) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

} // namespace

std::string TransferCommand::commandLine() const {
    std::ostringstream ss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            ss << ' ';
        }
        ss << quoteIfNeeded(argv[i]);
    }
    return ss.str();
}

TransferCommandBuilder::TransferCommandBuilder(const std::string& rsyncPath, const std::string& rclonePath)
    : rsyncPath_(rsyncPath)
    , rclonePath_(rclonePath) {
}

TransferCommand TransferCommandBuilder::build(const Job& job, int64_t startedAtMillis) const {
    TransferCommand command;
    command.source = job.source;

    if (job.mode == SyncMode::CLOUD) {
        command.tool = "rclone";
        command.destination = job.destination;
        command.argv = rcloneArgs(job);
        return command;
    }

    command.tool = "rsync";
    command.destination = job.destination;

    if (job.mode == SyncMode::TIME_MACHINE) {
        command.linkDest = findLatestSnapshot(job.destination);

        // Two runs inside the same second would share a folder; move to the next free second.
        int64_t millis = startedAtMillis;
        std::string folder = snapshotFolderName(millis);
        std::error_code ec;
        while (fs::exists(fs::path(job.destination) / folder, ec)) {
            millis += 1000;
            folder = snapshotFolderName(millis);
        }
        command.snapshotFolder = folder;
        command.destination = (fs::path(job.destination) / folder).string();
    }

    command.argv = rsyncArgs(job, command.destination, command.linkDest);
    return command;
}

std::vector<std::string> TransferCommandBuilder::rsyncArgs(const Job& job, const std::string& destination,
                                                           const std::optional<std::string>& linkDest) const {
    std::vector<std::string> args = {
        rsyncPath_,
        "-D",
        "--numeric-ids",
        "--links",
        "--hard-links",
        "--one-file-system",
        "--itemize-changes",
        "--times",
        "--recursive",
        "--perms",
        "--owner",
        "--group",
        "--stats",
        "--human-readable",
        "--info=progress2"
    };

    if (job.mode == SyncMode::MIRROR) {
        args.push_back("--delete");
    }
    if (linkDest && job.mode == SyncMode::TIME_MACHINE) {
        args.push_back("--link-dest=" + *linkDest);
    }
    for (const auto& pattern : job.excludePatterns) {
        std::string p = trimmed(pattern);
        if (!p.empty()) {
            args.push_back("--exclude=" + p);
        }
    }

    // Trailing slash copies the contents of the source, not the folder itself.
    args.push_back(withTrailingSlash(job.source));
    args.push_back(destination);
    return args;
}

std::vector<std::string> TransferCommandBuilder::rcloneArgs(const Job& job) const {
    std::vector<std::string> args = {
        rclonePath_,
        "sync",
        job.source,
        job.destination,
        "--stats=1s",
        "--stats-one-line",
        "-v"
    };
    for (const auto& pattern : job.excludePatterns) {
        std::string p = trimmed(pattern);
        if (!p.empty()) {
            args.push_back("--exclude=" + p);
        }
    }
    return args;
}

std::string TransferCommandBuilder::snapshotFolderName(int64_t millis) {
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d-%H%M%S");
    return ss.str();
}

bool TransferCommandBuilder::isSnapshotFolderName(const std::string& name) {
    static const std::regex re(R"(^\d{4}-\d{2}-\d{2}-\d{6}$)");
    return std::regex_match(name, re);
}

std::optional<std::string> TransferCommandBuilder::findLatestSnapshot(const std::string& destination) {
    std::error_code ec;
    fs::path root(destination);
    fs::path link = root / LATEST_LINK;

    if (fs::is_symlink(link, ec)) {
        fs::path target = fs::read_symlink(link, ec);
        if (!ec) {
            fs::path resolved = target.is_absolute() ? target : root / target;
            if (fs::is_directory(resolved, ec)) {
                return resolved.string();
            }
        }
    }

    std::vector<std::string> folders;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        std::string name = it->path().filename().string();
        if (it->is_directory(typeEc) && !it->is_symlink(typeEc) && isSnapshotFolderName(name)) {
            folders.push_back(name);
        }
    }
    if (folders.empty()) {
        return std::nullopt;
    }
    std::sort(folders.begin(), folders.end());
    return (root / folders.back()).string();
}

bool TransferCommandBuilder::updateLatestLink(const std::string& destination, const std::string& folderName,
                                              std::string& error) {
    fs::path link = fs::path(destination) / LATEST_LINK;
    fs::path staging = fs::path(destination) / ".latest.tmp";
    std::error_code ec;

    fs::remove(staging, ec);
    fs::create_directory_symlink(folderName, staging, ec);
    if (ec) {
        error = "cannot create symlink " + staging.string() + ": " + ec.message();
        return false;
    }
    // rename(2) replaces the old link atomically.
    fs::rename(staging, link, ec);
    if (ec) {
        error = "cannot replace " + link.string() + ": " + ec.message();
        fs::remove(staging, ec);
        return false;
    }
    return true;
}

bool TransferCommandBuilder::isRemoteDestination(const std::string& destination) {
    static const std::regex re(R"(^[A-Za-z0-9_][A-Za-z0-9_.\- ]*:.*$)");
    return std::regex_match(destination, re);
}

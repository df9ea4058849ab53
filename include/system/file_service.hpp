#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DirectoryEntry {
    std::string name;
    std::string path;
    bool isDirectory{false};
    uint64_t size{0};
    int64_t modified{0};    // Unix milliseconds
};

struct SandboxResult {
    bool success{false};
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const DirectoryEntry& entry);
void to_json(nlohmann::json& j, const SandboxResult& result);

// User-driven folder chooser supplied by the embedding shell.
class DirectoryPicker {
public:
    virtual ~DirectoryPicker() = default;
    virtual std::optional<std::string> pickDirectory() = 0;
};

class FileService {
public:
    explicit FileService(const std::string& opener = "xdg-open");

    // Directories first, then files, each sorted by name. Throws ValidationError.
    std::vector<DirectoryEntry> listDirectory(const std::string& path) const;

    SandboxResult createSandboxDirs(const std::string& source, const std::string& destination) const;

    // Hand the path to the desktop opener without waiting for it.
    bool openPath(const std::string& path);
    bool revealInFileManager(const std::string& path);

    std::string getLastError() const { return lastError_; }

private:
    bool launchDetached(const std::vector<std::string>& argv);

    std::string opener_;
    std::string lastError_;
};

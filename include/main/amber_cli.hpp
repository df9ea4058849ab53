#pragma once

#include "app/orchestrator.hpp"
#include "common/app_config.hpp"
#include <memory>
#include <string>
#include <vector>

// "amber" command line front end. Results and job events are written to
// stdout as one JSON document per line.
class AmberCli {
public:
    static const char* const VERSION;

    explicit AmberCli(std::shared_ptr<Orchestrator> orchestrator);

    // Returns the process exit code.
    int run(const std::vector<std::string>& args);

    static void printUsage();

private:
    int handleRunCommand(const std::vector<std::string>& args);
    int handleHistoryCommand(const std::vector<std::string>& args);
    int handleJobsCommand(const std::vector<std::string>& args);
    int handleDaemonCommand(const std::vector<std::string>& args);
    int handleDevCommand(const std::vector<std::string>& args);
    int handleDiskCommand(const std::vector<std::string>& args);
    int handleListCommand(const std::vector<std::string>& args);
    int handleSandboxCommand(const std::vector<std::string>& args);
    int handleOpenCommand(const std::vector<std::string>& args, bool reveal);

    int followJob(const std::string& jobId, const nlohmann::json& payload);

    std::shared_ptr<Orchestrator> orchestrator_;
};

// Entry point used by main(): parses global flags, sets up logging and the
// engine, then dispatches to AmberCli.
int amberMain(int argc, char* argv[]);

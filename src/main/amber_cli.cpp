#include "main/amber_cli.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "history/snapshot_store.hpp"
#include "jobs/transfer_process.hpp"
#include "system/disk_inspector.hpp"
#include <atomic>
#include <cstdint>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

const char* const AmberCli::VERSION = "1.0.0";

namespace {

std::atomic<bool> interrupted{false};

void handleInterrupt(int) {
    interrupted = true;
}

void printJson(const json& j) {
    std::cout << j.dump() << std::endl;
}

// Value of "--name value" in args, removing both from the list.
std::optional<std::string> takeOption(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            if (i + 1 >= args.size()) {
                throw ValidationError("option " + name + " needs a value");
            }
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> takeRepeated(std::vector<std::string>& args, const std::string& name) {
    std::vector<std::string> values;
    while (auto value = takeOption(args, name)) {
        values.push_back(*value);
    }
    return values;
}

int64_t parseInteger(const std::string& text, const std::string& what) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        throw ValidationError(what + " must be an integer, got '" + text + "'");
    }
}

json readJobPayload(const std::string& source) {
    std::stringstream buffer;
    if (source == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(source);
        if (!file.is_open()) {
            throw ValidationError("cannot open job file " + source);
        }
        buffer << file.rdbuf();
    }
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("malformed job JSON: ") + e.what());
    }
}

} // namespace

AmberCli::AmberCli(std::shared_ptr<Orchestrator> orchestrator)
    : orchestrator_(orchestrator) {
}

void AmberCli::printUsage() {
    std::cout << "Usage: amber [--config FILE] [--log-level LEVEL] <command> [options]\n"
              << "Commands:\n"
              << "  run <job.json|->                 Run a job and stream its events\n"
              << "  run --id ID --source DIR --dest DEST --mode MODE [--name N] [--exclude PATTERN]...\n"
              << "  jobs list | status | show <id> | next <id>\n"
              << "  jobs save <job.json|-> | delete <id> | import <dest> | mount <path>\n"
              << "  daemon                           Run scheduled jobs until interrupted\n"
              << "  history list <jobId> [--from MS --to MS]\n"
              << "  history search <pattern> [--job ID] [--limit N]\n"
              << "  history files <snapshotId>\n"
              << "  history stats | rebuild-index | verify-index | compact\n"
              << "  history prune <jobId> <keepLast>\n"
              << "  disk <path>                      Free and total space for a path\n"
              << "  ls <path>                        List a directory\n"
              << "  sandbox <source> <dest>          Create sandbox folders\n"
              << "  open <path> | reveal <path>      Hand a path to the desktop\n"
              << "  dev seed | churn | bench [name] | stats | clear\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version information\n";
}

int AmberCli::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 2;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (command == "run") {
            return handleRunCommand(rest);
        } else if (command == "jobs") {
            return handleJobsCommand(rest);
        } else if (command == "daemon") {
            return handleDaemonCommand(rest);
        } else if (command == "history") {
            return handleHistoryCommand(rest);
        } else if (command == "dev") {
            return handleDevCommand(rest);
        } else if (command == "disk") {
            return handleDiskCommand(rest);
        } else if (command == "ls") {
            return handleListCommand(rest);
        } else if (command == "sandbox") {
            return handleSandboxCommand(rest);
        } else if (command == "open") {
            return handleOpenCommand(rest, false);
        } else if (command == "reveal") {
            return handleOpenCommand(rest, true);
        }
    } catch (const ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::error(std::string("Command ") + command + " failed: " + e.what());
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 2;
}

int AmberCli::handleRunCommand(const std::vector<std::string>& input) {
    std::vector<std::string> args = input;
    json payload;

    auto id = takeOption(args, "--id");
    if (id) {
        payload["id"] = *id;
        payload["source"] = takeOption(args, "--source").value_or("");
        payload["destination"] = takeOption(args, "--dest").value_or("");
        payload["mode"] = takeOption(args, "--mode").value_or("");
        if (auto name = takeOption(args, "--name")) {
            payload["name"] = *name;
        }
        payload["excludePatterns"] = takeRepeated(args, "--exclude");
    } else if (args.size() == 1) {
        payload = readJobPayload(args[0]);
    } else {
        throw ValidationError("run needs a job file or --id/--source/--dest/--mode");
    }

    std::string jobId;
    if (payload.is_object() && payload.contains("id") && payload.at("id").is_string()) {
        jobId = payload.at("id").get<std::string>();
    }
    return followJob(jobId, payload);
}

int AmberCli::followJob(const std::string& jobId, const json& payload) {
    EventQueue queue;
    auto subscription = orchestrator_->subscribe(jobId, queue.listener());

    interrupted = false;
    auto previousInt = std::signal(SIGINT, handleInterrupt);
    auto previousTerm = std::signal(SIGTERM, handleInterrupt);

    orchestrator_->runJob(payload);

    int exitCode = 1;
    bool killSent = false;
    while (true) {
        if (interrupted && !killSent) {
            orchestrator_->killJob(jobId);
            killSent = true;
        }
        auto event = queue.waitNext(std::chrono::milliseconds(200));
        if (!event) {
            continue;
        }
        printJson(*event);
        if (event->type == JobEvent::Type::COMPLETED) {
            exitCode = event->completion && event->completion->success ? 0 : 1;
            break;
        }
        if (event->type == JobEvent::Type::REJECTED) {
            exitCode = 1;
            break;
        }
    }

    orchestrator_->unsubscribe(subscription);
    std::signal(SIGINT, previousInt);
    std::signal(SIGTERM, previousTerm);
    return exitCode;
}

int AmberCli::handleJobsCommand(const std::vector<std::string>& input) {
    if (input.empty()) {
        throw ValidationError("jobs needs a subcommand");
    }
    std::vector<std::string> args(input.begin() + 1, input.end());
    const std::string& sub = input[0];

    if (sub == "list" && args.empty()) {
        printJson(orchestrator_->getJobs());
        return 0;
    }
    if (sub == "status" && args.empty()) {
        printJson(orchestrator_->getJobsWithStatus());
        return 0;
    }
    if (sub == "save" && args.size() == 1) {
        printJson(orchestrator_->saveJob(readJobPayload(args[0])));
        return 0;
    }
    if (args.size() != 1) {
        throw ValidationError("jobs " + sub + " needs exactly one argument");
    }

    if (sub == "show") {
        for (const auto& job : orchestrator_->getJobs()) {
            if (job.id == args[0]) {
                printJson(job);
                return 0;
            }
        }
        std::cerr << "No saved job " << args[0] << std::endl;
        return 1;
    }
    if (sub == "delete") {
        bool deleted = orchestrator_->deleteJob(args[0]);
        printJson(json{{"deleted", deleted}});
        return deleted ? 0 : 1;
    }
    if (sub == "import") {
        auto job = orchestrator_->readJobFromDestination(args[0]);
        if (!job) {
            std::cerr << "No job config on " << args[0] << std::endl;
            return 1;
        }
        printJson(orchestrator_->saveJob(json(*job)));
        return 0;
    }
    if (sub == "next") {
        auto next = orchestrator_->getNextRun(args[0]);
        printJson(json{{"jobId", args[0]}, {"nextRun", next ? json(*next) : json(nullptr)}});
        return 0;
    }
    if (sub == "mount") {
        printJson(json{{"started", orchestrator_->handleVolumeMount(args[0])}});
        return 0;
    }
    throw ValidationError("unknown jobs subcommand '" + sub + "'");
}

int AmberCli::handleDaemonCommand(const std::vector<std::string>& args) {
    if (!args.empty()) {
        throw ValidationError("daemon takes no arguments");
    }

    EventQueue queue;
    auto subscription = orchestrator_->subscribe("", queue.listener());

    interrupted = false;
    auto previousInt = std::signal(SIGINT, handleInterrupt);
    auto previousTerm = std::signal(SIGTERM, handleInterrupt);
    Logger::info("Daemon started");

    while (!interrupted) {
        auto event = queue.waitNext(std::chrono::milliseconds(200));
        if (event) {
            printJson(*event);
        }
    }

    for (const auto& jobId : orchestrator_->getActiveRuns()) {
        orchestrator_->killJob(jobId);
    }
    if (!orchestrator_->waitForIdle(std::chrono::seconds(30))) {
        Logger::warning("Transfers still running at daemon shutdown");
    }
    while (auto event = queue.tryNext()) {
        printJson(*event);
    }

    orchestrator_->unsubscribe(subscription);
    std::signal(SIGINT, previousInt);
    std::signal(SIGTERM, previousTerm);
    Logger::info("Daemon stopped");
    return 0;
}

int AmberCli::handleHistoryCommand(const std::vector<std::string>& input) {
    if (input.empty()) {
        throw ValidationError("history needs a subcommand");
    }
    std::vector<std::string> args(input.begin() + 1, input.end());
    const std::string& sub = input[0];

    if (sub == "list") {
        auto from = takeOption(args, "--from");
        auto to = takeOption(args, "--to");
        if (args.size() != 1) {
            throw ValidationError("history list <jobId>");
        }
        std::optional<TimeRange> range;
        if (from || to) {
            range = TimeRange{from ? parseInteger(*from, "--from") : 0,
                              to ? parseInteger(*to, "--to") : INT64_MAX};
        }
        printJson(orchestrator_->querySnapshots(args[0], range));
        return 0;
    }
    if (sub == "search") {
        auto job = takeOption(args, "--job");
        auto limit = takeOption(args, "--limit");
        if (args.size() != 1) {
            throw ValidationError("history search <pattern>");
        }
        std::optional<size_t> max;
        if (limit) {
            int64_t value = parseInteger(*limit, "--limit");
            if (value < 0) {
                throw ValidationError("--limit must not be negative");
            }
            max = static_cast<size_t>(value);
        }
        printJson(orchestrator_->searchPaths(args[0], job, max));
        return 0;
    }
    if (sub == "files") {
        if (args.size() != 1) {
            throw ValidationError("history files <snapshotId>");
        }
        json files = json::array();
        for (const auto& file : orchestrator_->snapshotFiles(parseInteger(args[0], "snapshotId"))) {
            files.push_back(json{{"path", file.path}, {"size", file.size}});
        }
        printJson(files);
        return 0;
    }
    if (sub == "stats") {
        printJson(orchestrator_->historyStats());
        return 0;
    }
    if (sub == "prune") {
        if (args.size() != 2) {
            throw ValidationError("history prune <jobId> <keepLast>");
        }
        int64_t keep = parseInteger(args[1], "keepLast");
        if (keep < 0) {
            throw ValidationError("keepLast must not be negative");
        }
        printJson(json{{"removed", orchestrator_->pruneHistory(args[0], static_cast<size_t>(keep))}});
        return 0;
    }
    if (sub == "rebuild-index") {
        orchestrator_->rebuildIndex();
        printJson(json{{"rebuilt", true}});
        return 0;
    }
    if (sub == "verify-index") {
        bool ok = orchestrator_->verifyIndex();
        printJson(json{{"consistent", ok}});
        return ok ? 0 : 1;
    }
    if (sub == "compact") {
        orchestrator_->compactHistory();
        printJson(json{{"compacted", true}});
        return 0;
    }
    throw ValidationError("unknown history subcommand '" + sub + "'");
}

int AmberCli::handleDevCommand(const std::vector<std::string>& input) {
    if (input.empty()) {
        throw ValidationError("dev needs a subcommand");
    }
    const std::string& sub = input[0];

    if (sub == "seed") {
        printJson(orchestrator_->seedDatabase());
    } else if (sub == "churn") {
        printJson(orchestrator_->simulateChurn());
    } else if (sub == "bench") {
        if (input.size() > 1) {
            printJson(orchestrator_->benchmarkOperation(input[1]));
        } else {
            printJson(orchestrator_->benchmarkAll());
        }
    } else if (sub == "stats") {
        printJson(orchestrator_->getDbStats());
    } else if (sub == "clear") {
        orchestrator_->clearDevData();
        printJson(json{{"cleared", true}});
    } else {
        throw ValidationError("unknown dev subcommand '" + sub + "'");
    }
    return 0;
}

int AmberCli::handleDiskCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw ValidationError("disk <path>");
    }
    DiskStats stats = orchestrator_->getDiskStats(args[0]);
    printJson(stats);
    return stats.status == DiskStatus::AVAILABLE ? 0 : 1;
}

int AmberCli::handleListCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw ValidationError("ls <path>");
    }
    printJson(orchestrator_->listDirectory(args[0]));
    return 0;
}

int AmberCli::handleSandboxCommand(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        throw ValidationError("sandbox <source> <dest>");
    }
    SandboxResult result = orchestrator_->createSandboxDirs(args[0], args[1]);
    printJson(result);
    return result.success ? 0 : 1;
}

int AmberCli::handleOpenCommand(const std::vector<std::string>& args, bool reveal) {
    if (args.size() != 1) {
        throw ValidationError(reveal ? "reveal <path>" : "open <path>");
    }
    bool ok = reveal ? orchestrator_->revealInFileManager(args[0]) : orchestrator_->openPath(args[0]);
    if (!ok) {
        std::cerr << "Failed to open " << args[0] << std::endl;
    }
    return ok ? 0 : 1;
}

int amberMain(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            AmberCli::printUsage();
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << "amber version " << AmberCli::VERSION << std::endl;
            return 0;
        }
    }

    AppConfig config;
    try {
        auto configPath = takeOption(args, "--config");
        auto level = takeOption(args, "--log-level");
        config = configPath ? AppConfig::loadFromFile(*configPath) : AppConfig::defaults();
        if (level) {
            config.logLevel = Logger::parseLevel(*level, config.logLevel);
        }
    } catch (const AmberError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        AmberCli::printUsage();
        return 2;
    }

    if (!Logger::initialize(config.logPath, config.logLevel)) {
        std::cerr << "Failed to initialize logger at " << config.logPath << std::endl;
        return 1;
    }
    // stdout carries JSON only.
    Logger::setConsoleOutput(false);
    Logger::info("amber " + std::string(AmberCli::VERSION) + " command: " + args[0]);

    int exitCode = 1;
    try {
        auto store = std::make_shared<SnapshotStore>(config.databasePath);
        auto orchestrator = std::make_shared<Orchestrator>(
            config,
            std::make_shared<PosixProcessSpawner>(),
            store,
            std::make_shared<FilesystemDiskInspector>());
        AmberCli cli(orchestrator);
        exitCode = cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}

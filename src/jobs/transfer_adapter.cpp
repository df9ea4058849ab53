#include "jobs/transfer_adapter.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "jobs/progress_parser.hpp"
#include <filesystem>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

struct TransferAdapter::RunContext {
    Job job;
    std::string runId;
    TransferCommand command;
    std::unique_ptr<TransferProcess> process;
    std::shared_ptr<TransferObserver> observer;

    LineBuffer stdoutBuffer;
    LineBuffer stderrBuffer;
    std::optional<std::string> currentFile;

    std::mutex mutex;
    std::condition_variable finishedCondition;
    bool finished{false};
    bool cancelled{false};
    std::string cancelReason;
};

TransferAdapter::TransferAdapter(std::shared_ptr<ProcessSpawner> spawner, const TransferSettings& settings)
    : spawner_(spawner)
    , settings_(settings)
    , builder_(settings.rsyncPath, settings.rclonePath) {
    if (!spawner_) {
        throw std::invalid_argument("TransferAdapter requires a process spawner");
    }
}

TransferAdapter::~TransferAdapter() {
    killAll("shutdown");
    std::unique_lock<std::mutex> lock(threadsMutex_);
    threadsCondition_.wait(lock, [this] { return activeThreads_ == 0; });
}

void TransferAdapter::validatePaths(const Job& job) {
    std::error_code ec;
    if (job.source.empty() || !fs::is_directory(job.source, ec)) {
        throw ProcessSpawnError("source does not exist or is not a directory: " + job.source);
    }

    if (job.destination.empty()) {
        throw ProcessSpawnError("destination is empty");
    }

    if (job.mode == SyncMode::CLOUD) {
        if (!TransferCommandBuilder::isRemoteDestination(job.destination)) {
            throw ProcessSpawnError("cloud destination must look like remote:path, got " + job.destination);
        }
        return;
    }

    if (!fs::path(job.destination).is_absolute()) {
        throw ProcessSpawnError("destination must be an absolute path: " + job.destination);
    }
    fs::create_directories(job.destination, ec);
    if (ec || !fs::is_directory(job.destination, ec)) {
        throw ProcessSpawnError("cannot create destination " + job.destination +
                                (ec ? ": " + ec.message() : std::string()));
    }
}

TransferHandle TransferAdapter::start(const Job& job, const std::string& runId,
                                      std::shared_ptr<TransferObserver> observer) {
    if (!observer) {
        throw std::invalid_argument("TransferAdapter::start requires an observer");
    }
    validatePaths(job);

    auto context = std::make_shared<RunContext>();
    context->job = job;
    context->runId = runId;
    context->observer = observer;
    context->command = builder_.build(job, nowMillis());
    context->process = spawner_->spawn(context->command.argv);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_[runId] = context;
    }

    threadStarted();
    try {
        std::thread([this, context]() {
            supervise(context);
            threadFinished();
        }).detach();
    } catch (const std::system_error& e) {
        threadFinished();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            runs_.erase(runId);
        }
        throw ProcessSpawnError(std::string("cannot start supervisor thread: ") + e.what());
    }

    return runId;
}

void TransferAdapter::supervise(std::shared_ptr<RunContext> context) {
    RunContext& ctx = *context;
    const std::string& tool = ctx.command.tool;

    ctx.observer->onStarted(ctx.runId, ctx.process->pid());
    emitEngineLog(ctx, "Starting " + tool + ": " + ctx.command.source + " → " + ctx.command.destination);
    emitEngineLog(ctx, tool + " process started with PID " + std::to_string(ctx.process->pid()));
    if (ctx.command.linkDest) {
        emitEngineLog(ctx, "Found previous backup: " + fs::path(*ctx.command.linkDest).filename().string());
    } else if (ctx.job.mode == SyncMode::TIME_MACHINE) {
        emitEngineLog(ctx, "No previous backup found. Performing full backup.");
    }
    emitEngineLog(ctx, "Command: " + ctx.command.commandLine());

    std::optional<std::string> ioError;
    try {
        OutputChunk chunk;
        while (ctx.process->readChunk(chunk)) {
            LineBuffer& buffer = chunk.stream == LogStream::STDERR ? ctx.stderrBuffer : ctx.stdoutBuffer;
            for (const auto& line : buffer.append(chunk.data)) {
                handleLine(ctx, chunk.stream, line);
            }
        }
    } catch (const std::exception& e) {
        ioError = e.what();
        Logger::error("Reading " + tool + " output for run " + ctx.runId + " failed: " + e.what());
        ctx.process->forceKill();
    }

    if (auto rest = ctx.stdoutBuffer.flush()) {
        handleLine(ctx, LogStream::STDOUT, *rest);
    }
    if (auto rest = ctx.stderrBuffer.flush()) {
        handleLine(ctx, LogStream::STDERR, *rest);
    }

    std::optional<ProcessExit> exit;
    try {
        exit = ctx.process->wait();
    } catch (const std::exception& e) {
        if (!ioError) {
            ioError = e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        ctx.finished = true;
    }
    ctx.finishedCondition.notify_all();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_.erase(ctx.runId);
    }

    TransferOutcome outcome;
    outcome.mode = ctx.job.mode;
    outcome.completion = classify(ctx, exit, ioError);

    if (outcome.completion.success && ctx.job.mode == SyncMode::TIME_MACHINE && ctx.command.snapshotFolder) {
        std::string error;
        if (TransferCommandBuilder::updateLatestLink(ctx.job.destination, *ctx.command.snapshotFolder, error)) {
            emitEngineLog(ctx, "Updated 'latest' symlink to " + *ctx.command.snapshotFolder);
        } else {
            emitEngineLog(ctx, "Failed to update 'latest' symlink: " + error);
            Logger::warning(error);
        }
        outcome.snapshotPath = ctx.command.destination;
    }

    if (outcome.completion.success) {
        Logger::info("Run " + ctx.runId + " of job " + ctx.job.id + " finished successfully");
    } else {
        Logger::warning("Run " + ctx.runId + " of job " + ctx.job.id + " failed: " +
                        outcome.completion.error.value_or(""));
    }

    try {
        ctx.observer->onCompleted(outcome);
    } catch (const std::exception& e) {
        Logger::error("Completion handler for run " + ctx.runId + " threw: " + e.what());
    }
}

void TransferAdapter::handleLine(RunContext& ctx, LogStream stream, const std::string& line) {
    if (stream == LogStream::STDERR) {
        LogLine log;
        log.jobId = ctx.job.id;
        log.runId = ctx.runId;
        log.timestamp = nowMillis();
        log.stream = LogStream::STDERR;
        log.message = line;
        Logger::debug("[stderr] " + line);
        ctx.observer->onLog(log);
        return;
    }

    ParsedLine parsed = ProgressParser::parse(line);
    switch (parsed.kind) {
        case ParsedLine::Kind::NONE:
            return;
        case ParsedLine::Kind::PROGRESS: {
            ProgressEvent event;
            event.jobId = ctx.job.id;
            event.runId = ctx.runId;
            event.transferredBytes = parsed.progress.transferredBytes;
            event.percentage = parsed.progress.percentage;
            event.speedBytesPerSec = parsed.progress.speedBytesPerSec;
            event.etaSeconds = parsed.progress.etaSeconds;
            event.currentFile = ctx.currentFile;
            ctx.observer->onProgress(event);
            return;
        }
        case ParsedLine::Kind::LOG: {
            if (auto file = ProgressParser::extractCurrentFile(parsed.message)) {
                ctx.currentFile = file;
            }
            LogLine log;
            log.jobId = ctx.job.id;
            log.runId = ctx.runId;
            log.timestamp = nowMillis();
            log.stream = LogStream::STDOUT;
            log.message = parsed.message;
            ctx.observer->onLog(log);
            return;
        }
    }
}

void TransferAdapter::emitEngineLog(RunContext& ctx, const std::string& message) {
    LogLine log;
    log.jobId = ctx.job.id;
    log.runId = ctx.runId;
    log.timestamp = nowMillis();
    log.stream = LogStream::ENGINE;
    log.message = message;
    Logger::info("[" + ctx.job.id + "] " + message);
    ctx.observer->onLog(log);
}

CompletionEvent TransferAdapter::classify(RunContext& ctx, const std::optional<ProcessExit>& exit,
                                          const std::optional<std::string>& ioError) {
    CompletionEvent event;
    event.jobId = ctx.job.id;
    event.runId = ctx.runId;

    bool cancelled;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        cancelled = ctx.cancelled;
        reason = ctx.cancelReason;
    }

    const std::string& tool = ctx.command.tool;
    if (cancelled) {
        event.errorCode = JobErrorCode::CANCELLED;
        event.error = reason.empty() ? "cancelled" : reason;
    } else if (ioError) {
        event.errorCode = JobErrorCode::IO_ERROR;
        event.error = "I/O error while supervising " + tool + ": " + *ioError;
    } else if (exit && exit->exited && exit->exitCode == 0) {
        event.success = true;
    } else if (exit && exit->exited) {
        event.errorCode = JobErrorCode::NON_ZERO_EXIT;
        event.error = tool + " exited with code " + std::to_string(exit->exitCode);
    } else if (exit) {
        event.errorCode = JobErrorCode::IO_ERROR;
        event.error = tool + " terminated by signal " + std::to_string(exit->signal);
    } else {
        event.errorCode = JobErrorCode::IO_ERROR;
        event.error = tool + " exit status unavailable";
    }
    return event;
}

bool TransferAdapter::kill(const TransferHandle& handle, const std::string& reason) {
    std::shared_ptr<RunContext> context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(handle);
        if (it == runs_.end()) {
            return false;
        }
        context = it->second;
    }

    {
        std::lock_guard<std::mutex> lock(context->mutex);
        if (context->finished || context->cancelled) {
            return false;
        }
        context->cancelled = true;
        context->cancelReason = reason;
        Logger::info("Sending SIGTERM to " + context->command.tool + " (PID " +
                     std::to_string(context->process->pid()) + ") for run " + handle + ": " + reason);
        context->process->terminate();
    }

    threadStarted();
    std::thread([this, context]() {
        escalate(context);
        threadFinished();
    }).detach();
    return true;
}

void TransferAdapter::escalate(std::shared_ptr<RunContext> context) {
    std::unique_lock<std::mutex> lock(context->mutex);
    bool finished = context->finishedCondition.wait_for(lock, settings_.killGracePeriod,
                                                        [&context] { return context->finished; });
    if (!finished) {
        Logger::warning("Run " + context->runId + " ignored SIGTERM, sending SIGKILL");
        context->process->forceKill();
    }
}

void TransferAdapter::killAll(const std::string& reason) {
    std::vector<TransferHandle> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : runs_) {
            handles.push_back(pair.first);
        }
    }
    for (const auto& handle : handles) {
        kill(handle, reason);
    }
}

bool TransferAdapter::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(threadsMutex_);
    return threadsCondition_.wait_for(lock, timeout, [this] { return activeThreads_ == 0; });
}

size_t TransferAdapter::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

void TransferAdapter::threadStarted() {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    ++activeThreads_;
}

void TransferAdapter::threadFinished() {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    --activeThreads_;
    threadsCondition_.notify_all();
}

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class JobRegistry;

struct WatchdogPolicy {
    int stallTimeoutSeconds{0};     // 0 disables
    int runTimeoutSeconds{0};       // 0 disables
    std::chrono::milliseconds interval{1000};

    bool enabled() const { return stallTimeoutSeconds > 0 || runTimeoutSeconds > 0; }
};

// Periodically kills runs that stopped producing output or ran too long.
class RunWatchdog {
public:
    RunWatchdog(JobRegistry& registry, const WatchdogPolicy& policy);
    ~RunWatchdog();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // One pass at the given wall clock time. Returns the job ids that were killed.
    std::vector<std::string> checkOnce(int64_t nowMillis);

private:
    void watchLoop();

    JobRegistry& registry_;
    WatchdogPolicy policy_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable condition_;
};

#pragma once

#include "common/sync_types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct JobEvent {
    enum class Type {
        STARTED,
        LOG,
        PROGRESS,
        COMPLETED,
        REJECTED
    };

    Type type{Type::LOG};
    std::string jobId;
    std::string runId;
    int64_t timestamp{0};

    // Exactly one of these is set, matching the type. STARTED carries neither.
    std::optional<LogLine> log;
    std::optional<ProgressEvent> progress;
    std::optional<CompletionEvent> completion;

    static JobEvent started(const std::string& jobId, const std::string& runId);
    static JobEvent fromLog(const LogLine& line);
    static JobEvent fromProgress(const ProgressEvent& event);
    static JobEvent fromCompletion(const CompletionEvent& event);
    // Start rejected before a run existed; the completion carries the reason.
    static JobEvent rejected(const std::string& jobId, const std::string& error, JobErrorCode code);
};

std::string toString(JobEvent::Type type);
void to_json(nlohmann::json& j, const JobEvent& event);

using EventListener = std::function<void(const JobEvent&)>;

// Publish/subscribe fan-out of job events. Delivery is synchronous on the
// publishing thread, so events of one job reach every listener in publish order.
class EventBus {
public:
    using SubscriptionId = uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // An empty jobId subscribes to every job.
    SubscriptionId subscribe(const std::string& jobId, EventListener listener);
    bool unsubscribe(SubscriptionId id);
    void publish(const JobEvent& event);
    size_t subscriberCount() const;

private:
    struct Subscription {
        std::string jobId;
        EventListener listener;
    };

    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId nextId_{1};
    mutable std::mutex mutex_;
};

// Blocking consumer side of a subscription.
class EventQueue {
public:
    void push(const JobEvent& event);
    std::optional<JobEvent> waitNext(std::chrono::milliseconds timeout);
    std::optional<JobEvent> tryNext();
    void close();
    bool isClosed() const;
    size_t size() const;

    EventListener listener();

private:
    std::deque<JobEvent> events_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

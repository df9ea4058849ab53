#include "common/event_bus.hpp"
#include "common/logger.hpp"
#include <vector>

using json = nlohmann::json;

JobEvent JobEvent::started(const std::string& jobId, const std::string& runId) {
    JobEvent event;
    event.type = Type::STARTED;
    event.jobId = jobId;
    event.runId = runId;
    event.timestamp = nowMillis();
    return event;
}

JobEvent JobEvent::fromLog(const LogLine& line) {
    JobEvent event;
    event.type = Type::LOG;
    event.jobId = line.jobId;
    event.runId = line.runId;
    event.timestamp = line.timestamp;
    event.log = line;
    return event;
}

JobEvent JobEvent::fromProgress(const ProgressEvent& progress) {
    JobEvent event;
    event.type = Type::PROGRESS;
    event.jobId = progress.jobId;
    event.runId = progress.runId;
    event.timestamp = nowMillis();
    event.progress = progress;
    return event;
}

JobEvent JobEvent::fromCompletion(const CompletionEvent& completion) {
    JobEvent event;
    event.type = Type::COMPLETED;
    event.jobId = completion.jobId;
    event.runId = completion.runId;
    event.timestamp = nowMillis();
    event.completion = completion;
    return event;
}

JobEvent JobEvent::rejected(const std::string& jobId, const std::string& error, JobErrorCode code) {
    CompletionEvent completion;
    completion.jobId = jobId;
    completion.success = false;
    completion.error = error;
    completion.errorCode = code;

    JobEvent event;
    event.type = Type::REJECTED;
    event.jobId = jobId;
    event.timestamp = nowMillis();
    event.completion = completion;
    return event;
}

std::string toString(JobEvent::Type type) {
    switch (type) {
        case JobEvent::Type::STARTED:   return "started";
        case JobEvent::Type::LOG:       return "log";
        case JobEvent::Type::PROGRESS:  return "progress";
        case JobEvent::Type::COMPLETED: return "completed";
        case JobEvent::Type::REJECTED:  return "rejected";
    }
    return "unknown";
}

void to_json(json& j, const JobEvent& event) {
    j = json{
        {"type", toString(event.type)},
        {"jobId", event.jobId},
        {"runId", event.runId},
        {"timestamp", event.timestamp}
    };
    if (event.log) {
        j["payload"] = *event.log;
    } else if (event.progress) {
        j["payload"] = *event.progress;
    } else if (event.completion) {
        j["payload"] = *event.completion;
    }
}

EventBus::SubscriptionId EventBus::subscribe(const std::string& jobId, EventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextId_++;
    subscriptions_[id] = Subscription{jobId, std::move(listener)};
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

void EventBus::publish(const JobEvent& event) {
    // Listeners run outside the lock so they may subscribe or unsubscribe.
    std::vector<EventListener> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : subscriptions_) {
            if (pair.second.jobId.empty() || pair.second.jobId == event.jobId) {
                targets.push_back(pair.second.listener);
            }
        }
    }

    for (const auto& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            Logger::error("Event listener for job " + event.jobId + " threw: " + e.what());
        }
    }
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void EventQueue::push(const JobEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(event);
    }
    condition_.notify_one();
}

std::optional<JobEvent> EventQueue::waitNext(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    JobEvent event = events_.front();
    events_.pop_front();
    return event;
}

std::optional<JobEvent> EventQueue::tryNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    JobEvent event = events_.front();
    events_.pop_front();
    return event;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool EventQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

EventListener EventQueue::listener() {
    return [this](const JobEvent& event) { push(event); };
}

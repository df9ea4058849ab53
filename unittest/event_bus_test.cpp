#include <gtest/gtest.h>
#include "common/event_bus.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

class EventBusTest : public ::testing::Test {
protected:
    JobEvent logEvent(const std::string& jobId, const std::string& message) {
        LogLine line;
        line.jobId = jobId;
        line.runId = "run-" + jobId;
        line.timestamp = nowMillis();
        line.message = message;
        return JobEvent::fromLog(line);
    }

    EventBus bus_;
};

TEST_F(EventBusTest, DeliversOnlyMatchingJob) {
    std::vector<std::string> received;
    bus_.subscribe("a", [&received](const JobEvent& event) { received.push_back(event.log->message); });

    bus_.publish(logEvent("a", "one"));
    bus_.publish(logEvent("b", "other job"));
    bus_.publish(logEvent("a", "two"));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "one");
    EXPECT_EQ(received[1], "two");
}

TEST_F(EventBusTest, WildcardSubscriberSeesEveryJob) {
    int count = 0;
    bus_.subscribe("", [&count](const JobEvent&) { ++count; });
    bus_.publish(logEvent("a", "x"));
    bus_.publish(logEvent("b", "y"));
    EXPECT_EQ(count, 2);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    int count = 0;
    auto id = bus_.subscribe("a", [&count](const JobEvent&) { ++count; });
    EXPECT_EQ(bus_.subscriberCount(), 1u);
    bus_.publish(logEvent("a", "x"));

    EXPECT_TRUE(bus_.unsubscribe(id));
    EXPECT_FALSE(bus_.unsubscribe(id));
    bus_.publish(logEvent("a", "y"));
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus_.subscriberCount(), 0u);
}

TEST_F(EventBusTest, ThrowingListenerDoesNotBlockOthers) {
    int count = 0;
    bus_.subscribe("a", [](const JobEvent&) { throw std::runtime_error("listener failure"); });
    bus_.subscribe("a", [&count](const JobEvent&) { ++count; });
    EXPECT_NO_THROW(bus_.publish(logEvent("a", "x")));
    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, ListenerMayUnsubscribeItself) {
    int count = 0;
    EventBus::SubscriptionId id = 0;
    id = bus_.subscribe("a", [this, &count, &id](const JobEvent&) {
        ++count;
        bus_.unsubscribe(id);
    });
    bus_.publish(logEvent("a", "x"));
    bus_.publish(logEvent("a", "y"));
    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, QueuePreservesOrderAcrossThreads) {
    EventQueue queue;
    bus_.subscribe("a", queue.listener());

    std::thread producer([this] {
        for (int i = 0; i < 100; ++i) {
            bus_.publish(logEvent("a", std::to_string(i)));
        }
    });

    for (int i = 0; i < 100; ++i) {
        auto event = queue.waitNext(std::chrono::seconds(5));
        ASSERT_TRUE(event.has_value());
        EXPECT_EQ(event->log->message, std::to_string(i));
    }
    producer.join();
    EXPECT_FALSE(queue.tryNext().has_value());
}

TEST_F(EventBusTest, QueueWaitTimesOutAndClose) {
    EventQueue queue;
    EXPECT_FALSE(queue.waitNext(std::chrono::milliseconds(10)).has_value());

    queue.push(logEvent("a", "kept"));
    queue.close();
    EXPECT_TRUE(queue.isClosed());
    queue.push(logEvent("a", "dropped"));
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_TRUE(queue.tryNext().has_value());
    EXPECT_FALSE(queue.waitNext(std::chrono::seconds(1)).has_value());
}

TEST_F(EventBusTest, EventJsonShape) {
    CompletionEvent completion;
    completion.jobId = "a";
    completion.runId = "r1";
    completion.success = false;
    completion.error = "rsync exited with code 23";
    completion.errorCode = JobErrorCode::NON_ZERO_EXIT;

    nlohmann::json j = JobEvent::fromCompletion(completion);
    EXPECT_EQ(j["type"].get<std::string>(), "completed");
    EXPECT_EQ(j["jobId"].get<std::string>(), "a");
    EXPECT_FALSE(j["payload"]["success"].get<bool>());
    EXPECT_EQ(j["payload"]["errorCode"].get<std::string>(), "NON_ZERO_EXIT");

    nlohmann::json rejected = JobEvent::rejected("a", "bad payload", JobErrorCode::VALIDATION_FAILED);
    EXPECT_EQ(rejected["type"].get<std::string>(), "rejected");
    EXPECT_EQ(rejected["payload"]["errorCode"].get<std::string>(), "VALIDATION_FAILED");
}

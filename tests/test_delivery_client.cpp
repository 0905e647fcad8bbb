#include "delivery_client.h"
#include "http_client.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace test_support;
using json = nlohmann::json;
using std::chrono::milliseconds;

class DeliveryClientTest : public ::testing::Test {
protected:
    FakeHttpClient http_;
    FakeNotifier notifier_;
    DeliveryClient client_{"http://collector:3000", "device-key", http_, notifier_};

    std::vector<milliseconds> sleeps_;
    std::chrono::steady_clock::time_point now_{};

    void SetUp() override {
        client_.setSleeper([this](milliseconds d) { sleeps_.push_back(d); });
        client_.setClock([this] { return now_; });
    }

    static UsageEvent eventAt(const std::string& timestamp) {
        UsageEvent event;
        event.sessionId = "sess";
        event.project = "proj";
        event.timestamp = timestamp;
        event.inputTokens = 1;
        return event;
    }

    void queueEvents(size_t count) {
        std::vector<UsageEvent> events;
        for (size_t i = 0; i < count; ++i) events.push_back(eventAt("t" + std::to_string(i)));
        client_.addEvents(events);
    }

    void failEverything() {
        http_.setFallback(transportFailure(TransportError::ConnectionRefused, "refused"));
    }
};

TEST_F(DeliveryClientTest, EmptyQueueSendsNothing) {
    auto result = client_.flush();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.processed, 0u);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(http_.requests.empty());
}

TEST_F(DeliveryClientTest, SuccessfulFlushPostsEntriesAndEmptiesQueue) {
    queueEvents(2);
    http_.script(httpStatus(200, R"({"success":true,"processed":2})"));

    auto result = client_.flush();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.processed, 2u);
    EXPECT_EQ(client_.getQueueSize(), 0u);
    EXPECT_EQ(client_.state(), DeliveryState::Idle);

    ASSERT_EQ(http_.requests.size(), 1u);
    const auto& request = http_.requests[0];
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, "http://collector:3000/api/usage");

    bool has_key = false;
    bool has_content_type = false;
    for (const auto& [name, value] : request.headers) {
        if (name == "X-Device-Key" && value == "device-key") has_key = true;
        if (name == "Content-Type" && value == "application/json") has_content_type = true;
    }
    EXPECT_TRUE(has_key);
    EXPECT_TRUE(has_content_type);

    auto body = json::parse(request.body);
    ASSERT_TRUE(body["entries"].is_array());
    ASSERT_EQ(body["entries"].size(), 2u);
    EXPECT_EQ(body["entries"][0]["timestamp"], "t0");
    EXPECT_EQ(body["entries"][1]["timestamp"], "t1");
}

TEST_F(DeliveryClientTest, UnparsableSuccessBodyCountsWholeBatch) {
    queueEvents(3);
    http_.script(httpStatus(200, "OK"));

    auto result = client_.flush();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.processed, 3u);
}

TEST_F(DeliveryClientTest, NetworkFailureRetriesThenRestoresQueue) {
    queueEvents(2);
    failEverything();

    auto result = client_.flush();

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Cannot connect to server - is it running?");
    EXPECT_EQ(http_.requests.size(), 3u);
    EXPECT_EQ(sleeps_, (std::vector<milliseconds>{milliseconds(5000), milliseconds(5000)}));
    EXPECT_EQ(client_.getQueueSize(), 2u);
    EXPECT_EQ(client_.consecutiveFailures(), 1);
    EXPECT_TRUE(notifier_.notifications.empty());
    EXPECT_EQ(client_.state(), DeliveryState::Idle);
}

TEST_F(DeliveryClientTest, TransientFailureThenSuccess) {
    queueEvents(1);
    http_.script(transportFailure(TransportError::Timeout));
    http_.script(httpStatus(503, "unavailable"));
    http_.script(httpStatus(200, R"({"success":true,"processed":1})"));

    auto result = client_.flush();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(http_.requests.size(), 3u);
    EXPECT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(client_.getQueueSize(), 0u);
    EXPECT_EQ(client_.consecutiveFailures(), 0);
}

TEST_F(DeliveryClientTest, AuthFailureAbortsWithoutRetry) {
    queueEvents(2);
    http_.script(httpStatus(401, "unauthorized"));

    auto result = client_.flush();

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Authentication failed - invalid or expired API key");
    EXPECT_EQ(http_.requests.size(), 1u);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(client_.getQueueSize(), 2u);
    EXPECT_EQ(client_.state(), DeliveryState::AuthFailed);

    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].first, "Usage Daemon");
    EXPECT_NE(notifier_.notifications[0].second.find("Authentication failed"), std::string::npos);
}

TEST_F(DeliveryClientTest, RateLimitDoublesTheDelay) {
    queueEvents(1);
    http_.script(httpStatus(429, "slow down"));
    http_.script(httpStatus(429, "slow down"));
    http_.script(httpStatus(200, R"({"success":true,"processed":1})"));

    auto result = client_.flush();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.processed, 1u);
    EXPECT_EQ(http_.requests.size(), 3u);
    EXPECT_EQ(sleeps_, (std::vector<milliseconds>{milliseconds(10000), milliseconds(10000)}));
    EXPECT_EQ(client_.getQueueSize(), 0u);
}

TEST_F(DeliveryClientTest, NoSleepAfterFinalRateLimitedAttempt) {
    queueEvents(1);
    http_.setFallback(httpStatus(429));

    auto result = client_.flush();

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Rate limited - too many requests");
    EXPECT_EQ(http_.requests.size(), 3u);
    EXPECT_EQ(sleeps_, (std::vector<milliseconds>{milliseconds(10000), milliseconds(10000)}));
}

TEST_F(DeliveryClientTest, EventsAddedDuringFlushStayBehindFailedBatch) {
    queueEvents(2);
    failEverything();

    bool added = false;
    client_.setSleeper([&](milliseconds) {
        if (!added) {
            client_.addEvents({eventAt("late")});
            added = true;
        }
    });

    auto result = client_.flush();

    ASSERT_FALSE(result.success);
    const auto& queued = client_.queue().peek();
    ASSERT_EQ(queued.size(), 3u);
    EXPECT_EQ(queued[0].timestamp, "t0");
    EXPECT_EQ(queued[1].timestamp, "t1");
    EXPECT_EQ(queued[2].timestamp, "late");

    // The late event went out with nothing else in the failed request
    auto first_body = json::parse(http_.requests[0].body);
    EXPECT_EQ(first_body["entries"].size(), 2u);
}

TEST_F(DeliveryClientTest, NotifiesAfterThreeConsecutiveFailuresWithCooldown) {
    queueEvents(1);
    failEverything();

    client_.flush();
    client_.flush();
    EXPECT_TRUE(notifier_.notifications.empty());

    client_.flush();
    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].first, "Usage Daemon Error");
    EXPECT_NE(notifier_.notifications[0].second.find("3 attempts"), std::string::npos);

    // Still inside the cooldown window
    now_ += std::chrono::minutes(4);
    client_.flush();
    EXPECT_EQ(notifier_.notifications.size(), 1u);

    now_ += std::chrono::minutes(2);
    client_.flush();
    EXPECT_EQ(notifier_.notifications.size(), 2u);
    EXPECT_EQ(client_.consecutiveFailures(), 5);
    EXPECT_EQ(client_.getQueueSize(), 1u);
}

TEST_F(DeliveryClientTest, SuccessResetsFailureCount) {
    queueEvents(1);
    failEverything();
    client_.flush();
    client_.flush();
    EXPECT_EQ(client_.consecutiveFailures(), 2);

    http_.setFallback(httpStatus(200, R"({"success":true,"processed":1})"));
    EXPECT_TRUE(client_.flush().success);
    EXPECT_EQ(client_.consecutiveFailures(), 0);
}

TEST_F(DeliveryClientTest, NotificationsCanBeDisabled) {
    DeliveryOptions options;
    options.enableNotifications = false;
    DeliveryClient quiet("http://collector:3000", "k", http_, notifier_, options);
    quiet.setSleeper([](milliseconds) {});
    quiet.addEvents({eventAt("x")});
    http_.script(httpStatus(401));

    quiet.flush();
    EXPECT_TRUE(notifier_.notifications.empty());
}

TEST_F(DeliveryClientTest, TestConnectionUsesHealthEndpoint) {
    http_.script(httpStatus(200, "{}"));
    auto ok = client_.testConnection();
    EXPECT_TRUE(ok.success);
    ASSERT_EQ(http_.requests.size(), 1u);
    EXPECT_EQ(http_.requests[0].method, "GET");
    EXPECT_EQ(http_.requests[0].url, "http://collector:3000/api/health");

    http_.script(transportFailure(TransportError::DnsFailure));
    auto dns = client_.testConnection();
    EXPECT_FALSE(dns.success);
    EXPECT_TRUE(dns.unreachable);
    EXPECT_EQ(dns.error, "Server not found - check URL");

    http_.script(httpStatus(500));
    auto server_error = client_.testConnection();
    EXPECT_FALSE(server_error.success);
    EXPECT_FALSE(server_error.unreachable);
}

TEST_F(DeliveryClientTest, ValidateApiKeyOnlyRejectsOn401) {
    http_.script(httpStatus(401));
    EXPECT_FALSE(client_.validateApiKey().valid);

    http_.script(httpStatus(500));
    EXPECT_TRUE(client_.validateApiKey().valid);

    http_.script(transportFailure(TransportError::Timeout));
    auto network = client_.validateApiKey();
    EXPECT_TRUE(network.valid);
    EXPECT_EQ(network.error, "Could not verify (network error)");

    auto body = json::parse(http_.requests[0].body);
    EXPECT_TRUE(body["entries"].empty());
}

TEST_F(DeliveryClientTest, NonUtf8FieldsAreSentWithReplacementCharacters) {
    UsageEvent event = eventAt("t0");
    event.project = "caf\xE9";
    event.sessionId = "bad\xff";
    client_.addEvents({event});

    auto result = client_.flush();

    EXPECT_TRUE(result.success);
    ASSERT_EQ(http_.requests.size(), 1u);
    auto body = json::parse(http_.requests[0].body);
    EXPECT_EQ(body["entries"][0]["project"].get<std::string>(), "caf\xEF\xBF\xBD");
    EXPECT_EQ(body["entries"][0]["sessionId"].get<std::string>(), "bad\xEF\xBF\xBD");
    EXPECT_EQ(client_.getQueueSize(), 0u);
}

TEST_F(DeliveryClientTest, ThrowingTransportKeepsBatchAndRecovers) {
    queueEvents(2);
    http_.onRequest = [] { throw std::runtime_error("transport blew up"); };

    auto failed = client_.flush();

    EXPECT_FALSE(failed.success);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(*failed.error, "transport blew up");
    EXPECT_EQ(client_.getQueueSize(), 2u);
    EXPECT_EQ(client_.state(), DeliveryState::Idle);
    EXPECT_EQ(client_.consecutiveFailures(), 1);

    // The next cycle sends the same batch
    http_.onRequest = nullptr;
    http_.script(httpStatus(200, R"({"success":true,"processed":2})"));
    auto retried = client_.flush();

    EXPECT_TRUE(retried.success);
    EXPECT_EQ(retried.processed, 2u);
    EXPECT_EQ(http_.requests.size(), 2u);
    EXPECT_EQ(json::parse(http_.requests[1].body)["entries"].size(), 2u);
    EXPECT_EQ(client_.getQueueSize(), 0u);
}

TEST_F(DeliveryClientTest, StateNamesForLogs) {
    EXPECT_EQ(toString(DeliveryState::Idle), "idle");
    EXPECT_EQ(toString(DeliveryState::AuthFailed), "auth-failed");
    EXPECT_EQ(toString(TransportError::ConnectionRefused), "connection-refused");
}

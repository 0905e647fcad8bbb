#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "outbound_queue.h"

class HttpClient;
class Notifier;
struct HttpResponse;

enum class DeliveryState {
    Idle,
    Sending,
    Backoff,
    AuthFailed      // the last flush cycle was aborted by a 401
};

std::string toString(DeliveryState state);

struct FlushResult {
    bool success = false;
    size_t processed = 0;
    std::optional<std::string> error;
};

struct DeliveryOptions {
    int maxRetries = 3;
    std::chrono::milliseconds retryDelay{5000};
    std::chrono::milliseconds notificationCooldown{5 * 60 * 1000};
    int failureNotifyThreshold = 3;    // consecutive failed flushes before notifying
    bool enableNotifications = true;
};

struct ConnectionCheck {
    bool success = false;
    bool unreachable = false;   // refused or unresolvable, as opposed to a bad status
    std::string error;
};

struct ApiKeyCheck {
    bool valid = false;
    std::string error;
};

// Owns the outbound queue and ships it to the collector's /api/usage endpoint
class DeliveryClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    DeliveryClient(std::string server_url, std::string api_key,
                   HttpClient& http, Notifier& notifier,
                   DeliveryOptions options = {});

    void addEvents(const std::vector<UsageEvent>& events);
    size_t getQueueSize() const { return queue_.size(); }
    const OutboundQueue& queue() const { return queue_; }

    // One flush cycle: the whole queue, retried per DeliveryOptions
    FlushResult flush();

    // Diagnostics, not used for delivery
    ConnectionCheck testConnection();
    ApiKeyCheck validateApiKey();

    DeliveryState state() const { return state_; }
    int consecutiveFailures() const { return consecutive_failures_; }

    // Test seams
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void setClock(Clock clock) { clock_ = std::move(clock); }

private:
    std::string server_url_;
    std::string api_key_;
    HttpClient& http_;
    Notifier& notifier_;
    DeliveryOptions options_;

    OutboundQueue queue_;
    DeliveryState state_ = DeliveryState::Idle;
    bool sending_ = false;
    int consecutive_failures_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_notification_;

    Sleeper sleeper_;
    Clock clock_;

    // Retry loop for one snapshot; restores it to the queue on failure
    FlushResult sendBatch(std::vector<UsageEvent>& batch);
    static std::string describeFailure(const HttpResponse& response);
    void notify(const std::string& title, const std::string& message);
    void backoff(std::chrono::milliseconds delay);
};

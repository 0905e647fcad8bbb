#include "delivery_client.h"
#include "http_client.h"
#include "logger.h"
#include "notifier.h"
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
const char* kNotificationTitle = "Usage Daemon";
const char* kAuthFailedMessage = "Authentication failed - invalid or expired API key";
const char* kRateLimitedMessage = "Rate limited - too many requests";
} // namespace

std::string toString(DeliveryState state) {
    switch (state) {
        case DeliveryState::Idle:       return "idle";
        case DeliveryState::Sending:    return "sending";
        case DeliveryState::Backoff:    return "backoff";
        case DeliveryState::AuthFailed: return "auth-failed";
    }
    return "idle";
}

DeliveryClient::DeliveryClient(std::string server_url, std::string api_key,
                               HttpClient& http, Notifier& notifier,
                               DeliveryOptions options)
    : server_url_(std::move(server_url))
    , api_key_(std::move(api_key))
    , http_(http)
    , notifier_(notifier)
    , options_(options)
    , sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    , clock_([] { return std::chrono::steady_clock::now(); }) {}

void DeliveryClient::addEvents(const std::vector<UsageEvent>& events) {
    queue_.append(events);
}

FlushResult DeliveryClient::flush() {
    if (queue_.empty() || sending_) {
        return {true, 0, std::nullopt};
    }

    sending_ = true;
    std::vector<UsageEvent> batch = queue_.snapshot();

    try {
        return sendBatch(batch);
    } catch (const std::exception& e) {
        // batch is empty here if it was already restored
        if (!batch.empty()) {
            queue_.restoreFront(std::move(batch));
        }
        ++consecutive_failures_;
        sending_ = false;
        state_ = DeliveryState::Idle;
        logError("[DeliveryClient] Push aborted: " + std::string(e.what()));
        return {false, 0, std::string(e.what())};
    }
}

FlushResult DeliveryClient::sendBatch(std::vector<UsageEvent>& batch) {
    json body;
    body["entries"] = batch;
    const HttpHeaders headers = {{"X-Device-Key", api_key_}};
    const std::string url = server_url_ + "/api/usage";

    std::string last_error;
    for (int attempt = 1; attempt <= options_.maxRetries; ++attempt) {
        state_ = DeliveryState::Sending;
        HttpResponse response = http_.postJson(url, body, headers);

        if (response.ok()) {
            size_t processed = batch.size();
            try {
                auto reply = json::parse(response.body);
                processed = reply.value("processed", batch.size());
            } catch (const json::exception& e) {
                logWarn("[DeliveryClient] Unexpected response body, assuming "
                        + std::to_string(batch.size()) + " processed: " + e.what());
            }
            consecutive_failures_ = 0;
            sending_ = false;
            state_ = DeliveryState::Idle;
            return {true, processed, std::nullopt};
        }

        if (response.error == TransportError::HttpStatus && response.status == 401) {
            last_error = kAuthFailedMessage;
            logError("[DeliveryClient] API error: " + last_error);
            state_ = DeliveryState::AuthFailed;
            notify(kNotificationTitle, "Error: " + last_error);
            break;
        }

        if (response.error == TransportError::HttpStatus && response.status == 429) {
            last_error = kRateLimitedMessage;
            logError("[DeliveryClient] API error (attempt " + std::to_string(attempt) + "/"
                     + std::to_string(options_.maxRetries) + "): " + last_error);
            if (attempt < options_.maxRetries) {
                backoff(options_.retryDelay * 2);
            }
            continue;
        }

        last_error = describeFailure(response);
        logError("[DeliveryClient] Network error (attempt " + std::to_string(attempt) + "/"
                 + std::to_string(options_.maxRetries) + ", " + toString(response.error) + "): " + last_error);
        if (attempt < options_.maxRetries) {
            backoff(options_.retryDelay);
        }
    }

    // Anything queued while we were sending stays behind the failed batch
    queue_.restoreFront(std::move(batch));
    batch.clear();
    ++consecutive_failures_;
    sending_ = false;
    if (state_ != DeliveryState::AuthFailed) {
        state_ = DeliveryState::Idle;
    }

    if (consecutive_failures_ >= options_.failureNotifyThreshold) {
        notify(kNotificationTitle + std::string(" Error"),
               "Failed to sync data after " + std::to_string(consecutive_failures_)
               + " attempts. " + last_error);
    }

    logError("[DeliveryClient] Failed to push usage data after "
             + std::to_string(options_.maxRetries) + " attempts: " + last_error);
    return {false, 0, last_error};
}

ConnectionCheck DeliveryClient::testConnection() {
    HttpResponse response = http_.get(server_url_ + "/api/health", {{"X-Device-Key", api_key_}});
    if (response.ok()) {
        return {true, false, ""};
    }
    if (response.error == TransportError::HttpStatus) {
        if (response.status == 401) return {false, false, "Invalid API key"};
        return {false, false, "Server returned status " + std::to_string(response.status)};
    }
    bool unreachable = response.error == TransportError::ConnectionRefused
                       || response.error == TransportError::DnsFailure;
    return {false, unreachable, describeFailure(response)};
}

ApiKeyCheck DeliveryClient::validateApiKey() {
    json empty_batch;
    empty_batch["entries"] = json::array();
    HttpResponse response = http_.postJson(server_url_ + "/api/usage", empty_batch,
                                           {{"X-Device-Key", api_key_}});
    if (response.ok()) {
        return {true, ""};
    }
    if (response.error == TransportError::HttpStatus) {
        if (response.status == 401) return {false, "Invalid or expired API key"};
        // Other server errors say nothing about the key
        return {true, ""};
    }
    return {true, "Could not verify (network error)"};
}

std::string DeliveryClient::describeFailure(const HttpResponse& response) {
    switch (response.error) {
        case TransportError::Timeout:
            return "Connection timed out";
        case TransportError::ConnectionRefused:
            return "Cannot connect to server - is it running?";
        case TransportError::DnsFailure:
            return "Server not found - check URL";
        case TransportError::HttpStatus:
            return "Server error (" + std::to_string(response.status) + "): " + response.body;
        case TransportError::ParseError:
            return "Invalid response from server: " + response.errorMessage;
        case TransportError::None:
        case TransportError::Unknown:
            break;
    }
    return response.errorMessage.empty() ? "Unknown error occurred" : response.errorMessage;
}

void DeliveryClient::notify(const std::string& title, const std::string& message) {
    if (!options_.enableNotifications) return;

    auto now = clock_();
    if (last_notification_ && now - *last_notification_ < options_.notificationCooldown) {
        return;
    }
    last_notification_ = now;
    notifier_.notify(title, message);
}

void DeliveryClient::backoff(std::chrono::milliseconds delay) {
    state_ = DeliveryState::Backoff;
    sleeper_(delay);
}

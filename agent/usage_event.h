#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class EventType {
    User,
    Assistant,
    Summary
};

std::string toString(EventType type);
std::optional<EventType> parseEventType(const std::string& value);

// One usage-bearing log record, as shipped to the collector.
struct UsageEvent {
    std::string sessionId;
    std::string project;
    std::string timestamp;
    EventType type = EventType::Assistant;
    std::optional<std::string> model;
    uint64_t inputTokens = 0;
    uint64_t outputTokens = 0;
    uint64_t cacheCreationTokens = 0;
    uint64_t cacheReadTokens = 0;
    std::optional<double> costUSD;

    bool operator==(const UsageEvent& other) const;
    bool operator!=(const UsageEvent& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const UsageEvent& event);
void from_json(const nlohmann::json& j, UsageEvent& event);

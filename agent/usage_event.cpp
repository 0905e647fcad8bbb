#include "usage_event.h"
#include <stdexcept>

std::string toString(EventType type) {
    switch (type) {
        case EventType::User:      return "user";
        case EventType::Assistant: return "assistant";
        case EventType::Summary:   return "summary";
    }
    return "assistant";
}

std::optional<EventType> parseEventType(const std::string& value) {
    if (value == "user") return EventType::User;
    if (value == "assistant") return EventType::Assistant;
    if (value == "summary") return EventType::Summary;
    return std::nullopt;
}

bool UsageEvent::operator==(const UsageEvent& other) const {
    return sessionId == other.sessionId
        && project == other.project
        && timestamp == other.timestamp
        && type == other.type
        && model == other.model
        && inputTokens == other.inputTokens
        && outputTokens == other.outputTokens
        && cacheCreationTokens == other.cacheCreationTokens
        && cacheReadTokens == other.cacheReadTokens
        && costUSD == other.costUSD;
}

void to_json(nlohmann::json& j, const UsageEvent& event) {
    j = nlohmann::json{
        {"sessionId", event.sessionId},
        {"project", event.project},
        {"timestamp", event.timestamp},
        {"type", toString(event.type)},
        {"inputTokens", event.inputTokens},
        {"outputTokens", event.outputTokens},
        {"cacheCreationTokens", event.cacheCreationTokens},
        {"cacheReadTokens", event.cacheReadTokens}
    };
    // Optional fields are omitted rather than sent as null
    if (event.model) j["model"] = *event.model;
    if (event.costUSD) j["costUSD"] = *event.costUSD;
}

void from_json(const nlohmann::json& j, UsageEvent& event) {
    event.sessionId = j.at("sessionId").get<std::string>();
    event.project = j.at("project").get<std::string>();
    event.timestamp = j.at("timestamp").get<std::string>();

    auto type = parseEventType(j.at("type").get<std::string>());
    if (!type) {
        throw std::runtime_error("unknown event type: " + j.at("type").get<std::string>());
    }
    event.type = *type;

    event.model.reset();
    if (j.contains("model") && j["model"].is_string()) {
        event.model = j["model"].get<std::string>();
    }
    event.inputTokens = j.value("inputTokens", uint64_t{0});
    event.outputTokens = j.value("outputTokens", uint64_t{0});
    event.cacheCreationTokens = j.value("cacheCreationTokens", uint64_t{0});
    event.cacheReadTokens = j.value("cacheReadTokens", uint64_t{0});

    event.costUSD.reset();
    if (j.contains("costUSD") && j["costUSD"].is_number()) {
        event.costUSD = j["costUSD"].get<double>();
    }
}

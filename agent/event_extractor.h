#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "usage_event.h"

struct ExtractResult {
    std::vector<UsageEvent> events;
    uint64_t newOffset = 0;
    size_t linesConsumed = 0;
    size_t parseErrors = 0;
};

// Session id and project derived from .../projects/<project>/<sessionId>.jsonl
struct SessionInfo {
    std::string sessionId;
    std::string project;
};

class EventExtractor {
public:
    // Reads [start_offset, EOF) of the file and returns the usage events of
    // every complete line. A trailing line without '\n' is left for the next
    // pass and does not count towards newOffset.
    // Throws std::runtime_error (or std::filesystem::filesystem_error) when
    // the file cannot be read.
    ExtractResult extract(const std::string& file_path, uint64_t start_offset) const;

    static SessionInfo inferSessionInfo(const std::string& file_path);

    // Maps one parsed log record; empty when the record carries no usage
    static std::optional<UsageEvent> toUsageEvent(const nlohmann::json& record,
                                                  const SessionInfo& session);

    static std::string urlDecode(const std::string& value);
};

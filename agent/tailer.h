#pragma once

#include <functional>
#include <string>
#include <vector>
#include "event_extractor.h"
#include "position_store.h"

struct TailerStats {
    size_t filesProcessed = 0;
    size_t entriesFound = 0;
};

// Drives the extractor incrementally per file and keeps offsets durable
class Tailer {
public:
    using EventSink = std::function<void(const std::vector<UsageEvent>&)>;

    // Loads the persisted offsets from the store
    Tailer(PositionStore& store, EventSink sink);

    // Reads whatever is new in file_path since its recorded offset.
    // Never throws; failures are logged and the file is retried on its next change.
    size_t processFile(const std::string& file_path);

    void saveState();

    const DaemonState& state() const { return state_; }
    const TailerStats& stats() const { return stats_; }

private:
    PositionStore& store_;
    EventSink sink_;
    EventExtractor extractor_;
    DaemonState state_;
    TailerStats stats_;

    void persist(const std::string& file_path);
};

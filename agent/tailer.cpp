#include "tailer.h"
#include "logger.h"
#include <filesystem>

namespace fs = std::filesystem;

Tailer::Tailer(PositionStore& store, EventSink sink)
    : store_(store)
    , sink_(std::move(sink))
    , state_(store.load()) {}

size_t Tailer::processFile(const std::string& file_path) {
    if (fs::path(file_path).extension() != ".jsonl") {
        return 0;
    }

    try {
        uint64_t start = PositionStore::position(state_, file_path);

        uint64_t size = fs::file_size(file_path);
        if (size < start) {
            logWarn("[Tailer] " + file_path + " shrank from " + std::to_string(start) + " to "
                    + std::to_string(size) + " bytes, re-reading from the start");
            PositionStore::setPosition(state_, file_path, 0);
            persist(file_path);
            start = 0;
        }

        ExtractResult result = extractor_.extract(file_path, start);

        if (!result.events.empty()) {
            logInfo("[Tailer] Found " + std::to_string(result.events.size()) + " new entries in " + file_path);
            sink_(result.events);
            stats_.entriesFound += result.events.size();
        }

        if (result.newOffset > start) {
            PositionStore::setPosition(state_, file_path, result.newOffset);
            persist(file_path);
            ++stats_.filesProcessed;
        }
        return result.events.size();
    } catch (const std::exception& e) {
        logError("[Tailer] Error processing file " + file_path + ": " + e.what());
        return 0;
    }
}

void Tailer::saveState() {
    try {
        store_.save(state_);
    } catch (const std::exception& e) {
        logError("[Tailer] Failed to save state: " + std::string(e.what()));
    }
}

void Tailer::persist(const std::string& file_path) {
    try {
        store_.save(state_);
    } catch (const std::exception& e) {
        // The in-memory offset still advances; the next successful save records it
        logError("[Tailer] Failed to persist offset for " + file_path + ": " + e.what());
    }
}

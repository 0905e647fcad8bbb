#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>

struct DaemonState {
    std::map<std::string, uint64_t> filePositions;
    std::string lastSync;
};

// Persists file path -> last processed byte offset in the state file.
class PositionStore {
public:
    explicit PositionStore(const std::string& state_path);

    // Never fails: a missing or unreadable state file yields an empty state
    DaemonState load() const;
    void save(const DaemonState& state) const;
    void clear() const;

    const std::string& getStatePath() const { return state_path_; }

    static uint64_t position(const DaemonState& state, const std::string& file_path);
    static void setPosition(DaemonState& state, const std::string& file_path, uint64_t offset);

private:
    std::string state_path_;
    mutable std::set<std::string> unsaved_paths_;   // already warned about
};

#include "position_store.h"
#include "config_store.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

// The state file is JSON, so its keys must be valid UTF-8
bool isValidUtf8(const std::string& s) {
    try {
        nlohmann::json(s).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

DaemonState defaultState() {
    DaemonState state;
    state.lastSync = isoTimestampNow();
    return state;
}

} // namespace

PositionStore::PositionStore(const std::string& state_path) : state_path_(state_path) {}

DaemonState PositionStore::load() const {
    if (!fs::exists(state_path_)) {
        return defaultState();
    }

    try {
        std::ifstream file(state_path_);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open state file: " + state_path_);
        }
        nlohmann::json j;
        file >> j;

        DaemonState state;
        state.lastSync = j.value("lastSync", isoTimestampNow());
        auto positions = j.value("filePositions", nlohmann::json::object());
        for (const auto& [path, offset] : positions.items()) {
            if (offset.is_number_unsigned()) {
                state.filePositions[path] = offset.get<uint64_t>();
            } else if (offset.is_number_integer() && offset.get<int64_t>() >= 0) {
                state.filePositions[path] = static_cast<uint64_t>(offset.get<int64_t>());
            } else {
                logWarn("[PositionStore] Ignoring invalid offset for " + path);
            }
        }
        return state;
    } catch (const std::exception& e) {
        logWarn("[PositionStore] State unreadable, starting fresh: " + std::string(e.what()));
        return defaultState();
    }
}

void PositionStore::save(const DaemonState& state) const {
    nlohmann::json positions = nlohmann::json::object();
    for (const auto& [path, offset] : state.filePositions) {
        if (!isValidUtf8(path)) {
            if (unsaved_paths_.insert(path).second) {
                logWarn("[PositionStore] Not persisting offset for a path that is not valid UTF-8: " + path);
            }
            continue;
        }
        positions[path] = offset;
    }

    nlohmann::json j;
    j["filePositions"] = positions;
    j["lastSync"] = state.lastSync;
    writeJsonFileAtomically(state_path_, j);
}

void PositionStore::clear() const {
    std::error_code ec;
    fs::remove(state_path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot remove state file: " + ec.message());
    }
}

uint64_t PositionStore::position(const DaemonState& state, const std::string& file_path) {
    auto it = state.filePositions.find(file_path);
    return it == state.filePositions.end() ? 0 : it->second;
}

void PositionStore::setPosition(DaemonState& state, const std::string& file_path, uint64_t offset) {
    state.filePositions[file_path] = offset;
    state.lastSync = isoTimestampNow();
}

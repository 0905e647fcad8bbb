#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct DaemonConfig {
    std::string serverUrl;       // e.g. https://usage.example.com
    std::string deviceApiKey;    // sent as X-Device-Key
    std::string watchRoot;       // directory holding projects/<project>/<session>.jsonl
    int64_t     pushIntervalMs = 30000;

    std::string projectsDir() const;
};

// Throws std::runtime_error / nlohmann::json::exception on invalid input
void to_json(nlohmann::json& j, const DaemonConfig& config);
void from_json(const nlohmann::json& j, DaemonConfig& config);

// Writes pretty JSON through a temp file and a rename so readers never see a
// half-written file.
void writeJsonFileAtomically(const std::string& path, const nlohmann::json& j);

class ConfigStore {
public:
    // Resolves the directory from USAGE_DAEMON_HOME, XDG_CONFIG_HOME or ~/.config
    ConfigStore();
    explicit ConfigStore(const std::string& config_dir);

    std::optional<DaemonConfig> load() const;
    void save(const DaemonConfig& config) const;
    bool exists() const;
    void remove() const;
    void removeAll() const;

    // File layout
    const std::string& getConfigDir() const { return config_dir_; }
    std::string getConfigPath() const;
    std::string getStatePath() const;
    std::string getPidPath() const;
    std::string getLogPath() const;
    std::string getErrorLogPath() const;

    static std::string defaultConfigDir();
    static std::string defaultWatchRoot();

private:
    std::string config_dir_;
};

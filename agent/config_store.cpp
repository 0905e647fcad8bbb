#include "config_store.h"
#include "logger.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

constexpr int64_t kMaxPushIntervalMs = 24LL * 60 * 60 * 1000;

std::string homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    return "/tmp";
}

bool isHttpUrl(const std::string& url) {
    auto startsWith = [&](const std::string& prefix) {
        return url.size() > prefix.size() && url.compare(0, prefix.size(), prefix) == 0;
    };
    return startsWith("http://") || startsWith("https://");
}

} // namespace

std::string DaemonConfig::projectsDir() const {
    return (fs::path(watchRoot) / "projects").string();
}

void to_json(nlohmann::json& j, const DaemonConfig& config) {
    j = nlohmann::json{
        {"serverUrl", config.serverUrl},
        {"deviceApiKey", config.deviceApiKey},
        {"watchRoot", config.watchRoot},
        {"pushIntervalMs", config.pushIntervalMs}
    };
}

void from_json(const nlohmann::json& j, DaemonConfig& config) {
    config.serverUrl = j.at("serverUrl").get<std::string>();
    config.deviceApiKey = j.at("deviceApiKey").get<std::string>();

    // Configs written by earlier releases call the watch root "claudeDir"
    if (j.contains("watchRoot")) {
        config.watchRoot = j.at("watchRoot").get<std::string>();
    } else {
        config.watchRoot = j.at("claudeDir").get<std::string>();
    }
    config.pushIntervalMs = j.at("pushIntervalMs").get<int64_t>();

    while (!config.serverUrl.empty() && config.serverUrl.back() == '/') {
        config.serverUrl.pop_back();
    }
    if (!isHttpUrl(config.serverUrl)) {
        throw std::runtime_error("serverUrl must be an http(s) URL: " + config.serverUrl);
    }
    if (config.pushIntervalMs <= 0) {
        throw std::runtime_error("pushIntervalMs must be a positive integer");
    }
    if (config.pushIntervalMs > kMaxPushIntervalMs) {
        throw std::runtime_error("pushIntervalMs must not exceed one day ("
                                 + std::to_string(kMaxPushIntervalMs) + ")");
    }
    if (config.watchRoot.empty()) {
        throw std::runtime_error("watchRoot must not be empty");
    }
}

void writeJsonFileAtomically(const std::string& path, const nlohmann::json& j) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot create temp file: " + temp_path);
        }
        file << j.dump(2);
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed writing temp file: " + temp_path);
        }
    }
    fs::rename(temp_path, path);
}

ConfigStore::ConfigStore() : config_dir_(defaultConfigDir()) {}

ConfigStore::ConfigStore(const std::string& config_dir) : config_dir_(config_dir) {}

std::optional<DaemonConfig> ConfigStore::load() const {
    std::string path = getConfigPath();
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config: " + path);
        }
        nlohmann::json j;
        file >> j;
        return j.get<DaemonConfig>();
    } catch (const std::exception& e) {
        logError("[ConfigStore] Error loading config: " + std::string(e.what()));
        return std::nullopt;
    }
}

void ConfigStore::save(const DaemonConfig& config) const {
    writeJsonFileAtomically(getConfigPath(), nlohmann::json(config));
}

bool ConfigStore::exists() const {
    return fs::exists(getConfigPath());
}

void ConfigStore::remove() const {
    std::error_code ec;
    fs::remove(getConfigPath(), ec);
    if (ec) {
        throw std::runtime_error("Cannot remove config: " + ec.message());
    }
}

void ConfigStore::removeAll() const {
    std::error_code ec;
    fs::remove_all(config_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot remove config directory: " + ec.message());
    }
}

std::string ConfigStore::getConfigPath() const {
    return (fs::path(config_dir_) / "config.json").string();
}

std::string ConfigStore::getStatePath() const {
    return (fs::path(config_dir_) / "state.json").string();
}

std::string ConfigStore::getPidPath() const {
    return (fs::path(config_dir_) / "daemon.pid").string();
}

std::string ConfigStore::getLogPath() const {
    return (fs::path(config_dir_) / "daemon.log").string();
}

std::string ConfigStore::getErrorLogPath() const {
    return (fs::path(config_dir_) / "daemon.error.log").string();
}

std::string ConfigStore::defaultConfigDir() {
    const char* override_dir = std::getenv("USAGE_DAEMON_HOME");
    if (override_dir && *override_dir) {
        return override_dir;
    }
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / "usage-daemon").string();
    }
    return (fs::path(homeDir()) / ".config" / "usage-daemon").string();
}

std::string ConfigStore::defaultWatchRoot() {
#ifdef __APPLE__
    return (fs::path(homeDir()) / ".claude").string();
#else
    return (fs::path(homeDir()) / ".config" / "claude").string();
#endif
}

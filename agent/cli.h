#pragma once

#include <atomic>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "config_store.h"

class HttpClient;
class Notifier;
class ServiceInstaller;

// Command dispatch for the usage-daemon executable
class Cli {
public:
    Cli(ConfigStore& store, HttpClient& http, Notifier& notifier, ServiceInstaller& installer,
        std::istream& in, std::ostream& out, std::ostream& err);

    // args excludes the program name. Returns the process exit code.
    int run(const std::vector<std::string>& args, const std::atomic<bool>& shutdown_requested);

    static const char* kProgramName;
    static const char* kVersion;

private:
    ConfigStore& store_;
    HttpClient& http_;
    Notifier& notifier_;
    ServiceInstaller& installer_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

    // Commands
    int cmdSetup(const std::optional<std::string>& server, const std::optional<std::string>& key,
                 const std::optional<std::string>& name);
    int cmdStart(bool foreground, const std::atomic<bool>& shutdown_requested);
    int cmdStop();
    int cmdRestart();
    int cmdStatus(bool verbose);
    int cmdLogs(bool follow, bool errors, size_t lines, const std::atomic<bool>& shutdown_requested);
    int cmdTest();
    int cmdReset(bool include_config);
    int cmdUninstall(bool assume_yes);
    int cmdInstallService();

    // Setup helpers
    int validateAndSave(DaemonConfig config);
    int registerDevice(const std::string& server_url, const std::string& device_name);
    std::string prompt(const std::string& question, const std::string& default_value);

    int spawnBackground();
    std::optional<DaemonConfig> requireConfig();
    void printUsage(std::ostream& os) const;
};

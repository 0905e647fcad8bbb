#pragma once

#include <functional>
#include <string>
#include "config_store.h"

// Registers the worker with the per-user service manager: a systemd user unit
// on Linux, a LaunchAgent on macOS.
class ServiceInstaller {
public:
    using CommandRunner = std::function<int(const std::string& cmd)>;

    explicit ServiceInstaller(const ConfigStore& store);
    ServiceInstaller(const ConfigStore& store, std::string home_dir, CommandRunner runner);

    std::string servicePath() const;
    std::string renderServiceFile(const std::string& binary_path) const;

    bool isInstalled() const;
    bool install(const std::string& binary_path);
    // Returns false when nothing was installed
    bool uninstall();

    static const char* kServiceName;
    static const char* kLaunchAgentLabel;

private:
    const ConfigStore& store_;
    std::string home_dir_;
    CommandRunner run_;

    static int runShell(const std::string& cmd);
};

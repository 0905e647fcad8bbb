#include "service_installer.h"
#include "logger.h"
#include "notifier.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

const char* ServiceInstaller::kServiceName = "usage-daemon";
const char* ServiceInstaller::kLaunchAgentLabel = "com.usage-daemon.agent";

namespace {

std::string homeFromEnv() {
    const char* home = std::getenv("HOME");
    return (home && *home) ? home : "/tmp";
}

} // namespace

ServiceInstaller::ServiceInstaller(const ConfigStore& store)
    : ServiceInstaller(store, homeFromEnv(), &ServiceInstaller::runShell) {}

ServiceInstaller::ServiceInstaller(const ConfigStore& store, std::string home_dir, CommandRunner runner)
    : store_(store)
    , home_dir_(std::move(home_dir))
    , run_(std::move(runner)) {}

int ServiceInstaller::runShell(const std::string& cmd) {
    int status = std::system(cmd.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

std::string ServiceInstaller::servicePath() const {
#ifdef __APPLE__
    return (fs::path(home_dir_) / "Library/LaunchAgents" / (std::string(kLaunchAgentLabel) + ".plist")).string();
#else
    return (fs::path(home_dir_) / ".config/systemd/user" / (std::string(kServiceName) + ".service")).string();
#endif
}

std::string ServiceInstaller::renderServiceFile(const std::string& binary_path) const {
    std::ostringstream out;
#ifdef __APPLE__
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n";
    out << "<plist version=\"1.0\">\n";
    out << "<dict>\n";
    out << "  <key>Label</key>\n";
    out << "  <string>" << kLaunchAgentLabel << "</string>\n";
    out << "  <key>ProgramArguments</key>\n";
    out << "  <array>\n";
    out << "    <string>" << binary_path << "</string>\n";
    out << "    <string>start</string>\n";
    out << "    <string>--foreground</string>\n";
    out << "  </array>\n";
    out << "  <key>RunAtLoad</key>\n";
    out << "  <true/>\n";
    out << "  <key>KeepAlive</key>\n";
    out << "  <true/>\n";
    out << "  <key>StandardOutPath</key>\n";
    out << "  <string>" << store_.getLogPath() << "</string>\n";
    out << "  <key>StandardErrorPath</key>\n";
    out << "  <string>" << store_.getErrorLogPath() << "</string>\n";
    out << "  <key>EnvironmentVariables</key>\n";
    out << "  <dict>\n";
    out << "    <key>USAGE_DAEMON_MODE</key>\n";
    out << "    <string>1</string>\n";
    out << "    <key>USAGE_DAEMON_HOME</key>\n";
    out << "    <string>" << store_.getConfigDir() << "</string>\n";
    out << "  </dict>\n";
    out << "</dict>\n";
    out << "</plist>\n";
#else
    out << "[Unit]\n";
    out << "Description=Usage Daemon\n";
    out << "After=network-online.target\n\n";
    out << "[Service]\n";
    out << "Type=simple\n";
    out << "ExecStart=" << binary_path << " start --foreground\n";
    out << "Environment=USAGE_DAEMON_MODE=1\n";
    out << "Environment=USAGE_DAEMON_HOME=" << store_.getConfigDir() << "\n";
    out << "StandardOutput=append:" << store_.getLogPath() << "\n";
    out << "StandardError=append:" << store_.getErrorLogPath() << "\n";
    out << "Restart=always\n";
    out << "RestartSec=10\n\n";
    out << "[Install]\n";
    out << "WantedBy=default.target\n";
#endif
    return out.str();
}

bool ServiceInstaller::isInstalled() const {
    return fs::exists(servicePath());
}

bool ServiceInstaller::install(const std::string& binary_path) {
    const std::string path = servicePath();
    logInfo("[ServiceInstaller] Creating service file " + path);

    fs::create_directories(fs::path(path).parent_path());
    {
        std::ofstream service_file(path, std::ios::trunc);
        if (!service_file.is_open()) {
            logError("[ServiceInstaller] Cannot write " + path);
            return false;
        }
        service_file << renderServiceFile(binary_path);
    }
    chmod(path.c_str(), 0644);

    const std::string quoted = DesktopNotifier::shellQuote(path);
#ifdef __APPLE__
    if (run_("launchctl load " + quoted) != 0) {
        logError("[ServiceInstaller] launchctl load failed");
        return false;
    }
#else
    if (run_("command -v systemctl >/dev/null 2>&1") != 0) {
        logError("[ServiceInstaller] systemctl not available");
        return false;
    }
    if (run_("systemctl --user daemon-reload") != 0) {
        logError("[ServiceInstaller] systemctl --user daemon-reload failed");
        return false;
    }
    if (run_(std::string("systemctl --user enable --now ") + kServiceName + ".service") != 0) {
        logError("[ServiceInstaller] Failed to enable " + std::string(kServiceName) + ".service");
        return false;
    }
#endif
    logInfo("[ServiceInstaller] Service installed and started");
    return true;
}

bool ServiceInstaller::uninstall() {
    const std::string path = servicePath();
    if (!fs::exists(path)) {
        return false;
    }

    // The service may already be stopped or unloaded
#ifdef __APPLE__
    if (run_("launchctl unload " + DesktopNotifier::shellQuote(path) + " >/dev/null 2>&1") != 0) {
        logWarn("[ServiceInstaller] launchctl unload failed");
    }
#else
    if (run_(std::string("systemctl --user disable --now ") + kServiceName + ".service >/dev/null 2>&1") != 0) {
        logWarn("[ServiceInstaller] systemctl --user disable failed");
    }
#endif

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logError("[ServiceInstaller] Cannot remove " + path + ": " + ec.message());
        return false;
    }

#ifndef __APPLE__
    if (run_("systemctl --user daemon-reload >/dev/null 2>&1") != 0) {
        logWarn("[ServiceInstaller] systemctl --user daemon-reload failed");
    }
#endif
    logInfo("[ServiceInstaller] Removed " + path);
    return true;
}

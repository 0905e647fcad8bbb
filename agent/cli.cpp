#include "cli.h"
#include "daemon.h"
#include "delivery_client.h"
#include "http_client.h"
#include "logger.h"
#include "notifier.h"
#include "position_store.h"
#include "process_supervisor.h"
#include "service_installer.h"
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* Cli::kProgramName = "usage-daemon";
const char* Cli::kVersion = "1.0.0";

namespace {

constexpr int64_t kDefaultPushIntervalMs = 30000;
constexpr std::chrono::milliseconds kFollowInterval(200);

// Options are consumed as they are read; whatever is left over is unknown
class ArgList {
public:
    explicit ArgList(std::vector<std::string> args) : args_(std::move(args)) {}

    bool flag(const std::string& long_name, const std::string& short_name) {
        bool found = false;
        for (auto it = args_.begin(); it != args_.end();) {
            if (*it == long_name || *it == short_name) {
                found = true;
                it = args_.erase(it);
            } else {
                ++it;
            }
        }
        return found;
    }

    // Accepts "--name value" and "--name=value"
    std::optional<std::string> value(const std::string& long_name, const std::string& short_name) {
        std::optional<std::string> result;
        for (auto it = args_.begin(); it != args_.end();) {
            if (*it == long_name || *it == short_name) {
                if (it + 1 == args_.end()) {
                    throw std::runtime_error("Option " + *it + " requires a value");
                }
                result = *(it + 1);
                it = args_.erase(it, it + 2);
            } else if (it->rfind(long_name + "=", 0) == 0) {
                result = it->substr(long_name.size() + 1);
                it = args_.erase(it);
            } else {
                ++it;
            }
        }
        return result;
    }

    void expectEmpty() const {
        if (!args_.empty()) {
            throw std::runtime_error("Unknown argument: " + args_.front());
        }
    }

private:
    std::vector<std::string> args_;
};

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string localHostname() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

std::string defaultDeviceName() {
    const char* user = std::getenv("USER");
    std::string owner = (user && *user) ? user : "user";
#ifdef __APPLE__
    return owner + "'s Mac";
#else
    return owner + "'s Computer";
#endif
}

bool isDaemonMode() {
    const char* mode = std::getenv("USAGE_DAEMON_MODE");
    return mode && std::string(mode) == "1";
}

} // namespace

Cli::Cli(ConfigStore& store, HttpClient& http, Notifier& notifier, ServiceInstaller& installer,
         std::istream& in, std::ostream& out, std::ostream& err)
    : store_(store)
    , http_(http)
    , notifier_(notifier)
    , installer_(installer)
    , in_(in)
    , out_(out)
    , err_(err) {}

int Cli::run(const std::vector<std::string>& args, const std::atomic<bool>& shutdown_requested) {
    if (args.empty()) {
        printUsage(err_);
        return 1;
    }

    const std::string command = args.front();
    ArgList options(std::vector<std::string>(args.begin() + 1, args.end()));

    try {
        if (command == "--help" || command == "-h" || command == "help") {
            printUsage(out_);
            return 0;
        }
        if (command == "--version" || command == "-V") {
            out_ << kVersion << std::endl;
            return 0;
        }

        if (command == "setup") {
            auto server = options.value("--server", "-s");
            auto key = options.value("--key", "-k");
            auto name = options.value("--name", "-n");
            options.expectEmpty();
            return cmdSetup(server, key, name);
        }
        if (command == "start") {
            bool foreground = options.flag("--foreground", "-f");
            options.expectEmpty();
            return cmdStart(foreground, shutdown_requested);
        }
        if (command == "stop") {
            options.expectEmpty();
            return cmdStop();
        }
        if (command == "restart") {
            options.expectEmpty();
            return cmdRestart();
        }
        if (command == "status") {
            bool verbose = options.flag("--verbose", "-v");
            options.expectEmpty();
            return cmdStatus(verbose);
        }
        if (command == "logs") {
            bool follow = options.flag("--follow", "-f");
            bool errors = options.flag("--errors", "-e");
            auto lines_arg = options.value("--lines", "-n");
            options.expectEmpty();

            size_t lines = 50;
            if (lines_arg) {
                try {
                    long parsed = std::stol(*lines_arg);
                    if (parsed < 0) throw std::invalid_argument("negative");
                    lines = static_cast<size_t>(parsed);
                } catch (const std::exception&) {
                    throw std::runtime_error("--lines expects a non-negative number, got: " + *lines_arg);
                }
            }
            return cmdLogs(follow, errors, lines, shutdown_requested);
        }
        if (command == "test") {
            options.expectEmpty();
            return cmdTest();
        }
        if (command == "reset") {
            bool include_config = options.flag("--config", "-c");
            options.expectEmpty();
            return cmdReset(include_config);
        }
        if (command == "uninstall") {
            bool yes = options.flag("--yes", "-y");
            options.expectEmpty();
            return cmdUninstall(yes);
        }
        if (command == "install-service") {
            options.expectEmpty();
            return cmdInstallService();
        }

        err_ << "Unknown command: " << command << "\n\n";
        printUsage(err_);
        return 1;
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void Cli::printUsage(std::ostream& os) const {
    os << "Usage: " << kProgramName << " <command> [options]\n\n"
       << "Tracks local usage logs and pushes them to a collector server.\n\n"
       << "Commands:\n"
       << "  setup [--server URL] [--key KEY] [--name NAME]\n"
       << "                          Configure the daemon and register with the server\n"
       << "  start [--foreground]    Start the daemon\n"
       << "  stop                    Stop the daemon\n"
       << "  restart                 Restart the daemon\n"
       << "  status [--verbose]      Show daemon status and configuration\n"
       << "  logs [--follow] [--errors] [--lines N]\n"
       << "                          Show daemon logs\n"
       << "  test                    Test connection to the server\n"
       << "  reset [--config]        Reset state (re-process all files), optionally config too\n"
       << "  uninstall [--yes]       Stop the daemon and remove service, state, config and logs\n"
       << "  install-service         Start the daemon automatically at login\n\n"
       << "Options:\n"
       << "  -h, --help              Show this help\n"
       << "  -V, --version           Show version\n";
}

std::optional<DaemonConfig> Cli::requireConfig() {
    auto config = store_.load();
    if (!config) {
        err_ << "Daemon not configured. Run '" << kProgramName << " setup' first." << std::endl;
    }
    return config;
}

std::string Cli::prompt(const std::string& question, const std::string& default_value) {
    out_ << question;
    if (!default_value.empty()) {
        out_ << " (" << default_value << ")";
    }
    out_ << ": " << std::flush;

    std::string answer;
    std::getline(in_, answer);
    answer = trim(answer);
    return answer.empty() ? default_value : answer;
}

// Setup

int Cli::cmdSetup(const std::optional<std::string>& server, const std::optional<std::string>& key,
                  const std::optional<std::string>& name) {
    out_ << "\nUsage Daemon Setup\n" << std::endl;

    std::string server_url = server ? *server : prompt("Server URL", "http://localhost:3000");
    if (server_url.empty()) {
        err_ << "Server URL is required" << std::endl;
        return 1;
    }

    if (key) {
        DaemonConfig config;
        config.serverUrl = server_url;
        config.deviceApiKey = *key;
        config.watchRoot = ConfigStore::defaultWatchRoot();
        config.pushIntervalMs = kDefaultPushIntervalMs;
        return validateAndSave(config);
    }

    std::string device_name = name ? *name : prompt("Device name", defaultDeviceName());
    return registerDevice(server_url, device_name);
}

int Cli::validateAndSave(DaemonConfig config) {
    try {
        config = json(config).get<DaemonConfig>();
    } catch (const std::exception& e) {
        err_ << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    DeliveryClient client(config.serverUrl, config.deviceApiKey, http_, notifier_);

    out_ << "Testing connection to " << config.serverUrl << "..." << std::endl;
    ConnectionCheck connection = client.testConnection();
    if (connection.success) {
        out_ << "Server is reachable" << std::endl;
    } else if (connection.unreachable) {
        err_ << "Could not connect to server at " << config.serverUrl << ": " << connection.error << "\n"
             << "Make sure the server is running and accessible." << std::endl;
        return 1;
    } else {
        out_ << "Could not verify server (continuing anyway): " << connection.error << std::endl;
    }

    out_ << "Validating API key..." << std::endl;
    ApiKeyCheck key_check = client.validateApiKey();
    if (!key_check.valid) {
        err_ << "API key is invalid or expired. Please check the API key and try again." << std::endl;
        return 1;
    }
    if (key_check.error.empty()) {
        out_ << "API key is valid" << std::endl;
    } else {
        out_ << "Could not validate API key (continuing anyway): " << key_check.error << std::endl;
    }

    store_.save(config);

    out_ << "\nSetup complete!\n\n"
         << "Server URL:      " << config.serverUrl << "\n"
         << "Watch directory: " << config.watchRoot << "\n\n"
         << "To start the daemon:\n  " << kProgramName << " start\n"
         << "To install as a service (starts on login):\n  " << kProgramName << " install-service\n"
         << std::endl;
    return 0;
}

int Cli::registerDevice(const std::string& server_url, const std::string& device_name) {
    DaemonConfig config;
    config.serverUrl = server_url;
    config.watchRoot = ConfigStore::defaultWatchRoot();
    config.pushIntervalMs = kDefaultPushIntervalMs;
    try {
        config = json(config).get<DaemonConfig>();
    } catch (const std::exception& e) {
        err_ << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    out_ << "\nRegistering device with server..." << std::endl;

    json payload;
    payload["name"] = device_name;
    payload["hostname"] = localHostname();

    HttpResponse response = http_.postJson(config.serverUrl + "/api/devices/register", payload);
    if (!response.ok()) {
        if (response.error == TransportError::ConnectionRefused || response.error == TransportError::DnsFailure
            || response.error == TransportError::Timeout) {
            err_ << "Could not connect to server at " << config.serverUrl << "\n"
                 << "Make sure the server is running and accessible." << std::endl;
        } else if (response.error == TransportError::HttpStatus) {
            err_ << "Registration failed: " << response.body << std::endl;
        } else {
            err_ << "Registration failed: " << response.errorMessage << std::endl;
        }
        return 1;
    }

    std::string device_id;
    try {
        json reply = json::parse(response.body);
        device_id = reply.at("deviceId").get<std::string>();
        config.deviceApiKey = reply.at("apiKey").get<std::string>();
    } catch (const json::exception& e) {
        err_ << "Invalid registration response: " << e.what() << std::endl;
        return 1;
    }

    store_.save(config);

    out_ << "\nSetup complete!\n\n"
         << "Device ID:       " << device_id << "\n"
         << "API Key:         " << config.deviceApiKey << "\n"
         << "Watch directory: " << config.watchRoot << "\n\n"
         << "To start the daemon:\n  " << kProgramName << " start\n"
         << "To install as a service (starts on login):\n  " << kProgramName << " install-service\n"
         << std::endl;
    return 0;
}

// Lifecycle

int Cli::cmdStart(bool foreground, const std::atomic<bool>& shutdown_requested) {
    auto config = requireConfig();
    if (!config) {
        return 1;
    }

    ProcessSupervisor supervisor(store_);
    SupervisorStatus status = supervisor.status();
    // A spawned worker finds its own pid already recorded by the parent
    if (status.running && status.pid && *status.pid != getpid()) {
        out_ << "Daemon is already running (PID: " << *status.pid << ")\n"
             << "PID file: " << status.pidPath << std::endl;
        return 0;
    }

    if (!foreground) {
        return spawnBackground();
    }

    if (!isDaemonMode()) {
        out_ << "Starting daemon in foreground mode...\n"
             << "Press Ctrl+C to stop\n" << std::endl;
    }

    supervisor.writePidFile(getpid());
    Daemon daemon(*config, store_, http_, notifier_);
    int code = daemon.run(shutdown_requested);
    supervisor.releasePidFile(getpid());
    return code;
}

int Cli::spawnBackground() {
    out_ << "Starting daemon in background..." << std::endl;

    ProcessSupervisor supervisor(store_);
    pid_t pid = supervisor.spawnWorker(ProcessSupervisor::currentExecutable());

    out_ << "Daemon started (PID: " << pid << ")\n"
         << "Logs: " << store_.getLogPath() << std::endl;
    return 0;
}

int Cli::cmdStop() {
    ProcessSupervisor supervisor(store_);
    if (!supervisor.stop()) {
        out_ << "Daemon is not running" << std::endl;
        return 0;
    }
    out_ << "Daemon stopped" << std::endl;
    return 0;
}

int Cli::cmdRestart() {
    auto config = requireConfig();
    if (!config) {
        return 1;
    }

    ProcessSupervisor supervisor(store_);
    if (supervisor.stop()) {
        out_ << "Daemon stopped" << std::endl;
    }
    return spawnBackground();
}

int Cli::cmdStatus(bool verbose) {
    ProcessSupervisor supervisor(store_);
    SupervisorStatus status = supervisor.status();
    auto config = store_.load();

    out_ << "\nUsage Daemon Status\n" << std::string(40, '-') << "\n";

    if (status.running && status.pid) {
        out_ << "Status:      Running (PID: " << *status.pid << ")\n";
    } else {
        out_ << "Status:      Stopped\n";
    }

    if (!config) {
        out_ << "Config:      Not configured\n\n"
             << "Run '" << kProgramName << " setup' to configure.\n" << std::endl;
        return 0;
    }

    out_ << "Config:      Configured\n"
         << "Server URL:  " << config->serverUrl << "\n"
         << "Watch Dir:   " << config->watchRoot << "\n"
         << "Interval:    " << (config->pushIntervalMs / 1000.0) << "s\n";

    if (verbose) {
        out_ << std::string(40, '-') << "\n"
             << "File Paths:\n"
             << "  Config:    " << store_.getConfigPath() << "\n"
             << "  State:     " << store_.getStatePath() << "\n"
             << "  PID:       " << status.pidPath << "\n"
             << "  Logs:      " << status.logPath << "\n"
             << "  Errors:    " << status.errorLogPath << "\n";

        DaemonState state = PositionStore(store_.getStatePath()).load();
        out_ << "  Tracked:   " << state.filePositions.size() << " files";
        if (!state.lastSync.empty()) {
            out_ << " (last update " << state.lastSync << ")";
        }
        out_ << "\n";
    }
    out_ << std::endl;
    return 0;
}

// Maintenance

int Cli::cmdLogs(bool follow, bool errors, size_t lines, const std::atomic<bool>& shutdown_requested) {
    const std::string log_file = errors ? store_.getErrorLogPath() : store_.getLogPath();

    if (!fs::exists(log_file)) {
        out_ << "Log file not found: " << log_file << "\n"
             << "Daemon may not have been started yet." << std::endl;
        return 0;
    }

    std::ifstream file(log_file, std::ios::binary);
    if (!file.is_open()) {
        err_ << "Error reading logs: cannot open " << log_file << std::endl;
        return 1;
    }

    std::deque<std::string> tail;
    std::string line;
    while (std::getline(file, line)) {
        tail.push_back(line);
        if (tail.size() > lines) tail.pop_front();
    }
    for (const auto& l : tail) {
        out_ << l << "\n";
    }
    out_ << std::flush;

    if (!follow) {
        return 0;
    }

    // Follow until interrupted; a truncated log is read again from the top
    std::streamoff position = static_cast<std::streamoff>(fs::file_size(log_file));
    std::string partial;
    while (!shutdown_requested) {
        std::this_thread::sleep_for(kFollowInterval);

        std::error_code ec;
        auto size = static_cast<std::streamoff>(fs::file_size(log_file, ec));
        if (ec) continue;
        if (size < position) {
            position = 0;
            partial.clear();
        }
        if (size == position) continue;

        std::ifstream reader(log_file, std::ios::binary);
        reader.seekg(position);
        std::string chunk(static_cast<size_t>(size - position), '\0');
        reader.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
        chunk.resize(static_cast<size_t>(reader.gcount()));
        position += static_cast<std::streamoff>(chunk.size());

        partial += chunk;
        size_t newline = partial.rfind('\n');
        if (newline != std::string::npos) {
            out_ << partial.substr(0, newline + 1) << std::flush;
            partial.erase(0, newline + 1);
        }
    }
    return 0;
}

int Cli::cmdTest() {
    auto config = requireConfig();
    if (!config) {
        return 1;
    }

    out_ << "\nTesting connection to " << config->serverUrl << "...\n" << std::endl;

    DeliveryClient client(config->serverUrl, config->deviceApiKey, http_, notifier_);
    ConnectionCheck connection = client.testConnection();
    if (connection.success) {
        out_ << "Server is reachable" << std::endl;
    } else if (connection.unreachable) {
        err_ << "Connection failed: " << connection.error << std::endl;
        return 1;
    } else {
        out_ << "Health check failed: " << connection.error << std::endl;
    }

    ApiKeyCheck key_check = client.validateApiKey();
    if (!key_check.valid) {
        out_ << "API key is invalid or expired\n"
             << "Run '" << kProgramName << " setup' to reconfigure" << std::endl;
        return 1;
    }
    if (key_check.error.empty()) {
        out_ << "API key is valid" << std::endl;
    } else {
        out_ << "API key not verified: " << key_check.error << std::endl;
    }
    return 0;
}

int Cli::cmdReset(bool include_config) {
    out_ << "Resetting daemon state..." << std::endl;

    PositionStore(store_.getStatePath()).clear();
    out_ << "State cleared (all files will be re-processed on next start)" << std::endl;

    if (include_config) {
        store_.remove();
        out_ << "Configuration cleared (run '" << kProgramName << " setup' to reconfigure)" << std::endl;
    }

    ProcessSupervisor supervisor(store_);
    if (supervisor.isRunning()) {
        out_ << "The running daemon keeps its offsets in memory; restart it to re-process files" << std::endl;
    }
    return 0;
}

int Cli::cmdUninstall(bool assume_yes) {
    if (!assume_yes) {
        std::string answer = prompt("This will stop the daemon and remove all configuration. Continue? [y/N]", "");
        if (answer != "y" && answer != "Y") {
            out_ << "Cancelled." << std::endl;
            return 0;
        }
    }

    out_ << "\nUninstalling Usage Daemon...\n" << std::endl;

    ProcessSupervisor supervisor(store_);
    if (supervisor.stop()) {
        out_ << "Daemon stopped" << std::endl;
    }

    if (installer_.uninstall()) {
        out_ << "Removed service " << installer_.servicePath() << std::endl;
    }

    store_.removeAll();
    out_ << "Removed " << store_.getConfigDir() << " (config, state and logs)" << std::endl;

    out_ << "\nUninstall complete!\n" << std::endl;
    return 0;
}

int Cli::cmdInstallService() {
    auto config = requireConfig();
    if (!config) {
        return 1;
    }

    ProcessSupervisor supervisor(store_);
    if (supervisor.stop()) {
        out_ << "Stopped the background daemon; the service manager runs it from now on" << std::endl;
    }

    if (!installer_.install(ProcessSupervisor::currentExecutable())) {
        err_ << "Error installing service, see " << store_.getErrorLogPath() << std::endl;
        return 1;
    }

    out_ << "Service installed: " << installer_.servicePath() << "\n"
         << "The daemon will now start automatically at login.\n"
         << "To uninstall, run: " << kProgramName << " uninstall" << std::endl;
    return 0;
}

#include "process_supervisor.h"
#include "logger.h"
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
// How long a fresh worker must survive before start reports success
constexpr std::chrono::milliseconds kStartupGrace(300);

int openAppend(const std::string& path) {
    return open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}
} // namespace

ProcessSupervisor::ProcessSupervisor(const ConfigStore& store)
    : pid_path_(store.getPidPath())
    , log_path_(store.getLogPath())
    , error_log_path_(store.getErrorLogPath()) {}

std::optional<pid_t> ProcessSupervisor::readPid() const {
    std::ifstream file(pid_path_);
    if (!file.is_open()) {
        return std::nullopt;
    }
    long pid = 0;
    if (!(file >> pid) || pid <= 0 || pid > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool ProcessSupervisor::processAlive(pid_t pid) {
    // Reap our own exited children so they do not linger as zombies
    int status = 0;
    if (waitpid(pid, &status, WNOHANG) == pid) {
        return false;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}

bool ProcessSupervisor::isRunning() const {
    if (!fs::exists(pid_path_)) {
        return false;
    }
    auto pid = readPid();
    if (pid && processAlive(*pid)) {
        return true;
    }
    logWarn("[Supervisor] Removing stale pid file " + pid_path_);
    removePidFile();
    return false;
}

std::string ProcessSupervisor::currentExecutable() {
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len == -1) {
        throw std::runtime_error("Cannot resolve own executable: " + std::string(strerror(errno)));
    }
    buffer[len] = '\0';
    return buffer;
}

pid_t ProcessSupervisor::spawnWorker(const std::string& executable) const {
    fs::create_directories(fs::path(log_path_).parent_path());

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    int out_fd = openAppend(log_path_);
    int err_fd = openAppend(error_log_path_);
    if (null_fd == -1 || out_fd == -1 || err_fd == -1) {
        std::string reason = strerror(errno);
        if (null_fd != -1) close(null_fd);
        if (out_fd != -1) close(out_fd);
        if (err_fd != -1) close(err_fd);
        throw std::runtime_error("Cannot open worker log files: " + reason);
    }

    pid_t pid = fork();
    if (pid == -1) {
        std::string reason = strerror(errno);
        close(null_fd);
        close(out_fd);
        close(err_fd);
        throw std::runtime_error("fork failed: " + reason);
    }

    if (pid == 0) {
        // Child
        setsid();
        dup2(null_fd, STDIN_FILENO);
        dup2(out_fd, STDOUT_FILENO);
        dup2(err_fd, STDERR_FILENO);
        setenv("USAGE_DAEMON_MODE", "1", 1);

        const char* argv[] = {executable.c_str(), "start", "--foreground", nullptr};
        execv(executable.c_str(), const_cast<char* const*>(argv));
        _exit(127);
    }

    close(null_fd);
    close(out_fd);
    close(err_fd);

    writePidFile(pid);

    std::this_thread::sleep_for(kStartupGrace);
    if (!processAlive(pid)) {
        removePidFile();
        throw std::runtime_error("Worker exited during startup, see " + error_log_path_);
    }
    return pid;
}

bool ProcessSupervisor::stop(std::chrono::milliseconds poll_interval, int max_attempts) const {
    if (!isRunning()) {
        return false;
    }
    auto pid = readPid();
    if (!pid) {
        return false;
    }

    logInfo("[Supervisor] Stopping daemon (PID: " + std::to_string(*pid) + ")");
    if (kill(*pid, SIGTERM) == -1 && errno != ESRCH) {
        throw std::runtime_error("Cannot signal pid " + std::to_string(*pid) + ": " + strerror(errno));
    }

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        std::this_thread::sleep_for(poll_interval);
        if (!processAlive(*pid)) {
            removePidFile();
            return true;
        }
    }

    logWarn("[Supervisor] Daemon did not stop gracefully, sending SIGKILL");
    kill(*pid, SIGKILL);
    // Reap it if it is our child
    waitpid(*pid, nullptr, 0);
    removePidFile();
    return true;
}

SupervisorStatus ProcessSupervisor::status() const {
    SupervisorStatus status;
    status.running = isRunning();
    if (status.running) {
        status.pid = readPid();
    }
    status.pidPath = pid_path_;
    status.logPath = log_path_;
    status.errorLogPath = error_log_path_;
    return status;
}

void ProcessSupervisor::writePidFile(pid_t pid) const {
    fs::path parent = fs::path(pid_path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    std::ofstream file(pid_path_, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write pid file: " + pid_path_);
    }
    file << pid << "\n";
}

void ProcessSupervisor::removePidFile() const {
    std::error_code ec;
    fs::remove(pid_path_, ec);
}

void ProcessSupervisor::releasePidFile(pid_t pid) const {
    auto recorded = readPid();
    if (recorded && *recorded == pid) {
        removePidFile();
    }
}

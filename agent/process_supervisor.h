#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include "config_store.h"

struct SupervisorStatus {
    bool running = false;
    std::optional<pid_t> pid;
    std::string pidPath;
    std::string logPath;
    std::string errorLogPath;
};

// Starts, finds and stops the detached worker through the pid file
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(const ConfigStore& store);

    // Removes a pid file whose process no longer exists
    bool isRunning() const;
    std::optional<pid_t> readPid() const;

    // Forks `<executable> start --foreground` into its own session with its
    // output appended to the log files. Throws std::runtime_error on failure.
    pid_t spawnWorker(const std::string& executable) const;

    // SIGTERM, then SIGKILL once max_attempts polls have passed.
    // Returns false when nothing was running.
    bool stop(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500),
              int max_attempts = 10) const;

    SupervisorStatus status() const;

    // Used by the worker itself so that foreground runs are visible to `status`
    void writePidFile(pid_t pid) const;
    void removePidFile() const;
    // Removes the pid file only if it still names pid
    void releasePidFile(pid_t pid) const;

    static bool processAlive(pid_t pid);
    static std::string currentExecutable();

private:
    std::string pid_path_;
    std::string log_path_;
    std::string error_log_path_;
};

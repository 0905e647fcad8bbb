#include "daemon.h"
#include "logger.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
// Upper bound on how long a shutdown request can go unnoticed
constexpr std::chrono::milliseconds kMaxWait(100);
} // namespace

Daemon::Daemon(const DaemonConfig& config, const ConfigStore& store,
               HttpClient& http, Notifier& notifier, DaemonOptions options)
    : config_(config)
    , options_(options)
    , position_store_(store.getStatePath())
    , delivery_(config.serverUrl, config.deviceApiKey, http, notifier, options.delivery)
    , tailer_(position_store_, [this](const std::vector<UsageEvent>& events) { delivery_.addEvents(events); })
    , watcher_(config.projectsDir(), ".jsonl", options.stability) {}

int Daemon::run(const std::atomic<bool>& shutdown_requested) {
    const std::string projects_dir = config_.projectsDir();
    if (!fs::is_directory(projects_dir)) {
        logError("[Daemon] Projects directory not found: " + projects_dir);
        return 1;
    }

    logInfo("[Daemon] Starting usage daemon");
    logInfo("[Daemon] Watching: " + projects_dir);
    logInfo("[Daemon] Server: " + config_.serverUrl);
    logInfo("[Daemon] Push interval: " + std::to_string(config_.pushIntervalMs) + "ms");

    watcher_.setChangeCallback([this](const std::string& file_path, FileWatcher::ChangeKind kind) {
        if (kind == FileWatcher::ChangeKind::Added) {
            logInfo("[Daemon] New file detected: " + file_path);
        }
        tailer_.processFile(file_path);
    });

    try {
        watcher_.start(true);
    } catch (const std::exception& e) {
        logError("[Daemon] Failed to start file watcher: " + std::string(e.what()));
        return 1;
    }

    logInfo("[Daemon] Initial scan complete: " + std::to_string(tailer_.stats().filesProcessed)
            + " files processed, " + std::to_string(tailer_.stats().entriesFound) + " entries found");

    const std::chrono::milliseconds push_interval(config_.pushIntervalMs);
    auto next_flush = std::chrono::steady_clock::now() + push_interval;
    auto next_stats = std::chrono::steady_clock::now() + options_.statsInterval;

    while (!shutdown_requested) {
        try {
            auto now = std::chrono::steady_clock::now();
            auto until_flush = std::chrono::ceil<std::chrono::milliseconds>(next_flush - now);
            auto until_stats = std::chrono::ceil<std::chrono::milliseconds>(next_stats - now);
            auto wait = std::max(std::chrono::milliseconds(0),
                                 std::min({kMaxWait, until_flush, until_stats}));

            watcher_.poll(wait);

            now = std::chrono::steady_clock::now();
            if (now >= next_flush) {
                if (delivery_.getQueueSize() > 0) {
                    flushQueue("scheduled");
                }
                next_flush = std::chrono::steady_clock::now() + push_interval;
            }
            if (now >= next_stats) {
                logStats();
                next_stats = std::chrono::steady_clock::now() + options_.statsInterval;
            }
        } catch (const std::exception& e) {
            logError("[Daemon] Event loop error: " + std::string(e.what()));
        }
    }

    logInfo("[Daemon] Shutting down...");
    watcher_.stop();

    if (delivery_.getQueueSize() > 0) {
        logInfo("[Daemon] Flushing remaining entries...");
        flushQueue("final");
    }
    tailer_.saveState();

    logInfo("[Daemon] Daemon stopped");
    return 0;
}

void Daemon::flushQueue(const std::string& reason) {
    size_t queued = delivery_.getQueueSize();
    try {
        FlushResult result = delivery_.flush();
        if (result.success) {
            ++stats_.successfulFlushes;
            stats_.eventsSent += result.processed;
            logInfo("[Daemon] Pushed " + std::to_string(result.processed) + "/" + std::to_string(queued)
                    + " entries (" + reason + ")");
        } else {
            ++stats_.failedFlushes;
            logError("[Daemon] Push failed (" + reason + "): " + result.error.value_or("unknown error"));
        }
    } catch (const std::exception& e) {
        ++stats_.failedFlushes;
        logError("[Daemon] Push failed (" + reason + "): " + e.what());
    }
}

void Daemon::logStats() const {
    logInfo("[Daemon] Stats - queue: " + std::to_string(delivery_.getQueueSize())
            + ", sent: " + std::to_string(stats_.eventsSent)
            + ", successful pushes: " + std::to_string(stats_.successfulFlushes)
            + ", failed pushes: " + std::to_string(stats_.failedFlushes)
            + ", files processed: " + std::to_string(tailer_.stats().filesProcessed)
            + ", delivery: " + toString(delivery_.state()));
}

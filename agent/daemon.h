#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include "config_store.h"
#include "delivery_client.h"
#include "file_watcher.h"
#include "position_store.h"
#include "tailer.h"

class HttpClient;
class Notifier;

struct DaemonStats {
    size_t successfulFlushes = 0;
    size_t failedFlushes = 0;
    size_t eventsSent = 0;
};

struct DaemonOptions {
    std::chrono::milliseconds statsInterval{5 * 60 * 1000};
    std::chrono::milliseconds stability{500};
    DeliveryOptions delivery;
};

// The foreground worker: watches the projects tree, tails changed logs and
// pushes the queue on a timer until asked to shut down.
class Daemon {
public:
    Daemon(const DaemonConfig& config, const ConfigStore& store,
           HttpClient& http, Notifier& notifier, DaemonOptions options = {});

    // Blocks until shutdown_requested is set. Returns the process exit code.
    int run(const std::atomic<bool>& shutdown_requested);

    DeliveryClient& delivery() { return delivery_; }
    const Tailer& tailer() const { return tailer_; }
    const DaemonStats& stats() const { return stats_; }

private:
    DaemonConfig config_;
    DaemonOptions options_;

    // Declaration order matters: the tailer feeds the delivery client
    PositionStore position_store_;
    DeliveryClient delivery_;
    Tailer tailer_;
    FileWatcher watcher_;

    DaemonStats stats_;

    void flushQueue(const std::string& reason);
    void logStats() const;
};

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>

struct inotify_event;

// Reports files with a given extension anywhere beneath a root directory once
// they are added or modified. A change is only reported after the file size
// has stayed the same for the stability interval.
class FileWatcher {
public:
    enum class ChangeKind {
        Added,
        Modified
    };

    using ChangeCallback = std::function<void(const std::string& file_path, ChangeKind kind)>;

    FileWatcher(const std::string& root_dir,
                const std::string& extension = ".jsonl",
                std::chrono::milliseconds stability = std::chrono::milliseconds(500));
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    void setChangeCallback(ChangeCallback callback);

    // With scan_existing, every matching file already present is reported as
    // Added (sorted by path) before start() returns.
    void start(bool scan_existing);
    void stop();

    // Waits up to timeout for file events, then reports every settled change.
    // Returns early when interrupted by a signal.
    void poll(std::chrono::milliseconds timeout);

    bool isWatching() const { return watching_; }

private:
    struct PendingChange {
        ChangeKind kind;
        std::chrono::steady_clock::time_point due;
        uintmax_t size;
    };

    std::string root_dir_;
    std::string extension_;
    std::chrono::milliseconds stability_;
    ChangeCallback callback_;

    // inotify monitoring
    int inotify_fd_;
    std::map<int, std::string> watch_dirs_;
    std::set<std::string> watched_paths_;

    bool watching_;
    bool polling_;
    std::chrono::steady_clock::time_point next_rescan_;

    std::map<std::string, PendingChange> pending_;
    std::map<std::string, uintmax_t> known_sizes_;

    bool matches(const std::string& path) const;
    void addWatch(const std::string& dir);
    void addWatchesBelow(const std::string& dir, bool report_files);
    void readEvents();
    void handleEvent(const inotify_event* event);
    void schedule(const std::string& path, ChangeKind kind);
    void rescan();
    void dispatchDue();
    std::chrono::milliseconds timeUntilNextDue(std::chrono::milliseconds cap) const;
};

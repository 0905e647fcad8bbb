#include "file_watcher.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <vector>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO;
constexpr auto kPollingInterval = std::chrono::seconds(2);

} // namespace

FileWatcher::FileWatcher(const std::string& root_dir,
                         const std::string& extension,
                         std::chrono::milliseconds stability)
    : root_dir_(root_dir)
    , extension_(extension)
    , stability_(stability)
    , inotify_fd_(-1)
    , watching_(false)
    , polling_(false) {}

FileWatcher::~FileWatcher() {
    stop();
}

void FileWatcher::setChangeCallback(ChangeCallback callback) {
    callback_ = std::move(callback);
}

bool FileWatcher::matches(const std::string& path) const {
    return fs::path(path).extension() == extension_;
}

void FileWatcher::start(bool scan_existing) {
    if (watching_) {
        return;
    }
    if (!fs::is_directory(root_dir_)) {
        throw std::runtime_error("Watch root is not a directory: " + root_dir_);
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ == -1) {
        logWarn("[FileWatcher] inotify unavailable (" + std::string(strerror(errno))
                + "), falling back to polling");
        polling_ = true;
    }

    watching_ = true;
    addWatchesBelow(root_dir_, false);

    // Existing files are reported immediately, without the stability wait
    std::vector<std::string> existing;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root_dir_, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec) && matches(it->path().string())) {
            existing.push_back(it->path().string());
        }
    }
    std::sort(existing.begin(), existing.end());

    for (const auto& path : existing) {
        std::error_code size_ec;
        uintmax_t size = fs::file_size(path, size_ec);
        known_sizes_[path] = size_ec ? 0 : size;
        if (scan_existing && callback_) {
            callback_(path, ChangeKind::Added);
        }
    }

    next_rescan_ = std::chrono::steady_clock::now() + kPollingInterval;
    logInfo("[FileWatcher] Watching " + root_dir_ + " (" + std::to_string(watch_dirs_.size())
            + " directories, " + (polling_ ? "polling" : "inotify") + ")");
}

void FileWatcher::stop() {
    if (!watching_) {
        return;
    }
    watching_ = false;

    if (inotify_fd_ != -1) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    watch_dirs_.clear();
    watched_paths_.clear();
    pending_.clear();
}

void FileWatcher::addWatch(const std::string& dir) {
    if (polling_ || watched_paths_.count(dir)) {
        return;
    }
    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd == -1) {
        logError("[FileWatcher] Failed to watch " + dir + ": " + strerror(errno));
        return;
    }
    watch_dirs_[wd] = dir;
    watched_paths_.insert(dir);
}

void FileWatcher::addWatchesBelow(const std::string& dir, bool report_files) {
    addWatch(dir);

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::string path = it->path().string();
        if (it->is_directory(ec)) {
            addWatch(path);
        } else if (report_files && it->is_regular_file(ec) && matches(path)) {
            // Files can land in a new directory before its watch exists
            schedule(path, known_sizes_.count(path) ? ChangeKind::Modified : ChangeKind::Added);
        }
    }
}

void FileWatcher::poll(std::chrono::milliseconds timeout) {
    if (!watching_) {
        return;
    }

    std::chrono::milliseconds wait = timeUntilNextDue(timeout);

    if (polling_) {
        if (::poll(nullptr, 0, static_cast<int>(wait.count())) == -1 && errno == EINTR) {
            return;
        }
        if (std::chrono::steady_clock::now() >= next_rescan_) {
            rescan();
            next_rescan_ = std::chrono::steady_clock::now() + kPollingInterval;
        }
        dispatchDue();
        return;
    }

    struct pollfd pfd;
    pfd.fd = inotify_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (ready == -1) {
        if (errno != EINTR) {
            logError("[FileWatcher] poll failed: " + std::string(strerror(errno)));
        }
        return;
    }
    if (ready > 0 && (pfd.revents & POLLIN)) {
        readEvents();
    }
    dispatchDue();
}

void FileWatcher::readEvents() {
    const size_t EVENT_SIZE = sizeof(struct inotify_event);
    const size_t BUF_LEN = 1024 * (EVENT_SIZE + 16);
    alignas(struct inotify_event) char buffer[BUF_LEN];

    for (;;) {
        ssize_t length = read(inotify_fd_, buffer, BUF_LEN);
        if (length < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logError("[FileWatcher] Error reading inotify events: " + std::string(strerror(errno)));
            }
            return;
        }
        if (length == 0) {
            return;
        }

        ssize_t i = 0;
        while (i < length) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(&buffer[i]);
            handleEvent(event);
            i += EVENT_SIZE + event->len;
        }
    }
}

void FileWatcher::handleEvent(const inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        logWarn("[FileWatcher] Event queue overflowed, rescanning " + root_dir_);
        rescan();
        return;
    }

    auto dir_it = watch_dirs_.find(event->wd);
    if (dir_it == watch_dirs_.end()) {
        return;
    }

    if (event->mask & IN_IGNORED) {
        watched_paths_.erase(dir_it->second);
        watch_dirs_.erase(dir_it);
        return;
    }
    if (event->len == 0) {
        return;
    }

    std::string path = (fs::path(dir_it->second) / event->name).string();

    if (event->mask & IN_ISDIR) {
        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
            addWatchesBelow(path, true);
        }
        return;
    }

    if (!matches(path)) {
        return;
    }
    schedule(path, known_sizes_.count(path) ? ChangeKind::Modified : ChangeKind::Added);
}

void FileWatcher::schedule(const std::string& path, ChangeKind kind) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return;
    }

    auto due = std::chrono::steady_clock::now() + stability_;
    auto it = pending_.find(path);
    if (it == pending_.end()) {
        pending_[path] = PendingChange{kind, due, size};
    } else {
        // An add that has not been reported yet stays an add
        if (it->second.kind != ChangeKind::Added) it->second.kind = kind;
        it->second.due = due;
        it->second.size = size;
    }
}

void FileWatcher::rescan() {
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root_dir_, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::string path = it->path().string();
        if (it->is_directory(ec)) {
            addWatch(path);
            continue;
        }
        if (!it->is_regular_file(ec) || !matches(path) || pending_.count(path)) {
            continue;
        }

        std::error_code size_ec;
        uintmax_t size = fs::file_size(path, size_ec);
        if (size_ec) continue;

        auto known = known_sizes_.find(path);
        if (known == known_sizes_.end()) {
            schedule(path, ChangeKind::Added);
        } else if (known->second != size) {
            schedule(path, ChangeKind::Modified);
        }
    }
}

void FileWatcher::dispatchDue() {
    auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, ChangeKind>> ready;

    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.due > now) {
            ++it;
            continue;
        }

        std::error_code ec;
        uintmax_t size = fs::file_size(it->first, ec);
        if (ec) {
            it = pending_.erase(it);
            continue;
        }
        if (size != it->second.size) {
            // Still being written
            it->second.size = size;
            it->second.due = now + stability_;
            ++it;
            continue;
        }

        known_sizes_[it->first] = size;
        ready.emplace_back(it->first, it->second.kind);
        it = pending_.erase(it);
    }

    if (!callback_) {
        return;
    }
    for (const auto& [path, kind] : ready) {
        callback_(path, kind);
    }
}

std::chrono::milliseconds FileWatcher::timeUntilNextDue(std::chrono::milliseconds cap) const {
    auto now = std::chrono::steady_clock::now();
    std::chrono::milliseconds wait = cap;
    for (const auto& entry : pending_) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(entry.second.due - now);
        if (remaining < std::chrono::milliseconds(0)) remaining = std::chrono::milliseconds(0);
        wait = std::min(wait, remaining);
    }
    return wait;
}

// watch_session.cpp - inotify watch with debounce for one entity

#include "watch_session.hpp"
#include "logger.hpp"

#include <sys/inotify.h>
#include <sys/eventfd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <dirent.h>
#include <poll.h>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <system_error>

namespace savekeeper {

// Size of inotify event buffer
static constexpr size_t EVENT_BUF_LEN = 1024 * (sizeof(struct inotify_event) + 256);

// Everything we subscribe to; the root's own removal arrives as DELETE_SELF / MOVE_SELF
static constexpr uint32_t WATCH_EVENTS = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE |
                                         IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB |
                                         IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

// Events that push the debounce deadline back
static constexpr uint32_t QUALIFYING_EVENTS = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE |
                                              IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB;

// Upper bound on one poll() so the loop never parks forever on a missed wakeup
static constexpr int MAX_POLL_MS = 1000;

static bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Editor swap files and partial downloads
static bool is_scratch_name(const std::string& name) {
    return ends_with(name, ".swp") || ends_with(name, "~") || ends_with(name, ".part");
}

std::string to_string(WatchState state) {
    switch (state) {
        case WatchState::Stopped:  return "stopped";
        case WatchState::Starting: return "starting";
        case WatchState::Watching: return "watching";
        case WatchState::Stopping: return "stopping";
        case WatchState::Error:    return "error";
    }
    return "unknown";
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    auto delay = base_delay;
    for (int i = 0; i < attempt; i++) {
        if (delay >= max_delay / 2) return max_delay;
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

WatchSession::WatchSession(EntityProfile profile, RetryPolicy retry_policy)
    : profile_(std::move(profile))
    , retry_policy_(retry_policy)
    , debounce_(profile_.debounce_window) {
    while (profile_.source_path.size() > 1 && profile_.source_path.back() == '/') {
        profile_.source_path.pop_back();
    }
}

WatchSession::~WatchSession() {
    stop();
}

bool WatchSession::start() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != WatchState::Stopped) {
            return true;  // Already running
        }
        state_ = WatchState::Starting;
        debounce_.cancel();
        pending_retrigger_ = false;
        retry_count_ = 0;
        retry_scheduled_ = false;
        persistent_failure_ = false;
        last_error_.clear();
    }
    notify_state(WatchState::Starting, "", false);

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (inotify_fd_ < 0 || wake_fd_ < 0) {
        std::string error = "failed to initialize inotify: " + std::string(strerror(errno));
        Logger::error("[WatchSession] " + profile_.id + ": " + error);
        if (inotify_fd_ >= 0) close(inotify_fd_);
        if (wake_fd_ >= 0) close(wake_fd_);
        inotify_fd_ = wake_fd_ = -1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = WatchState::Stopped;
            last_error_ = error;
        }
        notify_state(WatchState::Stopped, error, false);
        return false;
    }

    std::string error;
    bool watching = add_watches(error);
    size_t watch_count = wd_to_path_.size();
    if (watching) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = WatchState::Watching;
    } else {
        enter_error(error);
    }

    stop_requested_.store(false);
    try {
        thread_ = std::thread(&WatchSession::watch_loop, this);
    } catch (const std::system_error& e) {
        Logger::error("[WatchSession] " + profile_.id + ": failed to create thread: " + e.what());
        remove_all_watches();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            close(inotify_fd_);
            close(wake_fd_);
            inotify_fd_ = wake_fd_ = -1;
            state_ = WatchState::Stopped;
            last_error_ = e.what();
        }
        notify_state(WatchState::Stopped, e.what(), false);
        return false;
    }

    if (watching) {
        Logger::info("[WatchSession] Watching " + profile_.id + " at " + profile_.source_path + " (" +
                     std::to_string(watch_count) + " directories)");
        notify_state(WatchState::Watching, "", false);
    }
    return watching;
}

void WatchSession::stop() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);

    if (thread_.joinable() && thread_.get_id() == std::this_thread::get_id()) {
        Logger::error("[WatchSession] " + profile_.id + ": stop() called from its own callback, ignored");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == WatchState::Stopped) {
            return;
        }
        state_ = WatchState::Stopping;
        debounce_.cancel();
        pending_retrigger_ = false;
        retry_scheduled_ = false;
    }
    notify_state(WatchState::Stopping, "", false);

    stop_requested_.store(true);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_locked();
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    remove_all_watches();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inotify_fd_ >= 0) close(inotify_fd_);
        if (wake_fd_ >= 0) close(wake_fd_);
        inotify_fd_ = wake_fd_ = -1;
        state_ = WatchState::Stopped;
    }

    Logger::info("[WatchSession] Stopped watching " + profile_.id);
    notify_state(WatchState::Stopped, "", false);
}

bool WatchSession::add_watches(std::string& error) {
    remove_all_watches();
    return add_watch_recursive(profile_.source_path, true, error);
}

bool WatchSession::add_watch_recursive(const std::string& path, bool is_root, std::string& error) {
    int wd = inotify_add_watch(inotify_fd_, path.c_str(), WATCH_EVENTS);
    if (wd < 0) {
        int err = errno;
        if (err == ENOSPC) {
            Logger::error("[WatchSession] inotify watch limit reached! Increase /proc/sys/fs/inotify/max_user_watches");
            error = "inotify watch limit reached";
            return false;
        }
        if (is_root) {
            error = "cannot watch " + path + ": " + strerror(err);
            return false;
        }
        if (err != ENOENT) {
            Logger::warn("[WatchSession] Failed to watch " + path + ": " + strerror(err));
        }
        return true;  // Continue anyway, don't fail the whole entity
    }

    if (is_root) root_wd_ = wd;
    wd_to_path_[wd] = path;

    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return true;  // Can't open, but we did add the watch
    }

    bool ok = true;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }

        std::string full_path = path + "/" + entry->d_name;

        // lstat: symlinked directories are not followed
        struct stat st;
        if (lstat(full_path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            if (!add_watch_recursive(full_path, false, error)) {
                ok = false;
                break;
            }
        }
    }

    closedir(dir);
    return ok;
}

void WatchSession::remove_all_watches() {
    if (inotify_fd_ >= 0) {
        for (const auto& pair : wd_to_path_) {
            inotify_rm_watch(inotify_fd_, pair.first);
        }
    }
    wd_to_path_.clear();
    root_wd_ = -1;
}

void WatchSession::remove_watches_under(const std::string& path) {
    const std::string prefix = path + "/";
    for (auto it = wd_to_path_.begin(); it != wd_to_path_.end(); ) {
        if (it->second == path || it->second.compare(0, prefix.size(), prefix) == 0) {
            inotify_rm_watch(inotify_fd_, it->first);
            it = wd_to_path_.erase(it);
        } else {
            ++it;
        }
    }
}

bool WatchSession::handle_event(int wd, uint32_t mask, const char* name, std::string& failure) {
    if (mask & IN_Q_OVERFLOW) {
        Logger::warn("[WatchSession] Event queue overflow for " + profile_.id + ", treating as a change");
        return true;
    }

    if (wd == root_wd_ && (mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED | IN_UNMOUNT))) {
        failure = "source path was removed or moved: " + profile_.source_path;
        return false;
    }

    auto it = wd_to_path_.find(wd);
    if (it == wd_to_path_.end()) {
        return false;  // Unknown or already removed watch descriptor
    }

    if (mask & IN_IGNORED) {
        wd_to_path_.erase(it);  // subdirectory is gone
        return false;
    }
    if (mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
        return false;  // the parent directory reports it
    }

    const std::string dir_path = it->second;
    const std::string filename = name ? name : "";

    if (!filename.empty() && is_scratch_name(filename)) {
        return false;
    }

    if (mask & IN_DELETE) {
        Logger::debug("[WatchSession] Deletion of " + filename + " in " + profile_.id + " ignored");
        return false;
    }

    if ((mask & IN_ISDIR) && !filename.empty()) {
        std::string child = dir_path + "/" + filename;
        if (mask & (IN_CREATE | IN_MOVED_TO)) {
            Logger::debug("[WatchSession] New directory: " + child);
            std::string error;
            if (!add_watch_recursive(child, false, error)) {
                Logger::warn("[WatchSession] " + error);
            }
        } else if (mask & IN_MOVED_FROM) {
            remove_watches_under(child);
        }
    }

    // Attribute change on a watched directory itself, e.g. link count while it is removed
    if (filename.empty() && (mask & IN_ATTRIB)) {
        return false;
    }

    if (mask & QUALIFYING_EVENTS) {
        std::string event_type;
        if (mask & IN_CREATE) event_type = "CREATE";
        else if (mask & IN_MODIFY) event_type = "MODIFY";
        else if (mask & IN_CLOSE_WRITE) event_type = "CLOSE_WRITE";
        else if (mask & IN_MOVED_FROM) event_type = "MOVED_FROM";
        else if (mask & IN_MOVED_TO) event_type = "MOVED_TO";
        else event_type = "ATTRIB";
        Logger::debug("[WatchSession] Event: " + event_type + " - " +
                      (filename.empty() ? std::string("(dir)") : filename) + " (" + profile_.id + ")");
        return true;
    }
    return false;
}

void WatchSession::watch_loop() {
    alignas(struct inotify_event) char buffer[EVENT_BUF_LEN];

    Logger::debug("[WatchSession] Watch loop started for " + profile_.id);

    while (!stop_requested_.load()) {
        struct pollfd fds[2];
        fds[0].fd = wake_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = inotify_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int poll_result = poll(fds, 2, poll_timeout_ms());
        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, try again
            }
            std::string error = "poll() error: " + std::string(strerror(errno));
            Logger::error("[WatchSession] " + error);
            enter_error(error);
            break;
        }

        if (stop_requested_.load()) {
            break;
        }

        if (fds[0].revents & POLLIN) {
            uint64_t value;
            while (read(wake_fd_, &value, sizeof(value)) > 0) {
            }
        }

        bool qualifying = false;
        std::string failure;

        if (fds[1].revents & POLLIN) {
            ssize_t len = read(inotify_fd_, buffer, EVENT_BUF_LEN);
            if (len < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                failure = "read() error: " + std::string(strerror(errno));
            }

            ssize_t i = 0;
            while (len > 0 && i < len && failure.empty()) {
                struct inotify_event* event = reinterpret_cast<struct inotify_event*>(buffer + i);
                if (handle_event(event->wd, event->mask, event->len > 0 ? event->name : nullptr, failure)) {
                    qualifying = true;
                }
                i += sizeof(struct inotify_event) + event->len;
            }
        }

        if (!failure.empty()) {
            enter_error(failure);
            continue;
        }

        auto now = DebounceTimer::Clock::now();
        bool fire = false;
        bool recover = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == WatchState::Watching) {
                if (qualifying) {
                    debounce_.reset(now);
                }
                fire = debounce_.take_expired(now);
            }
            if (state_ == WatchState::Error && retry_scheduled_ && now >= retry_deadline_) {
                retry_scheduled_ = false;
                recover = true;
            }
        }

        if (fire) {
            Logger::info("[WatchSession] Changes in " + profile_.id + " settled, triggering backup");
            if (trigger_callback_) {
                try {
                    trigger_callback_(profile_.id);
                } catch (const std::exception& e) {
                    Logger::error("[WatchSession] Trigger handler failed for " + profile_.id + ": " + e.what());
                }
            }
        }

        if (recover) {
            try_recover();
        }
    }

    Logger::debug("[WatchSession] Watch loop ended for " + profile_.id);
}

void WatchSession::enter_error(const std::string& reason) {
    remove_all_watches();

    bool persistent;
    int attempt;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == WatchState::Stopping || state_ == WatchState::Stopped) {
            return;
        }
        debounce_.cancel();
        state_ = WatchState::Error;
        last_error_ = reason;

        if (retry_count_ >= retry_policy_.max_attempts) {
            persistent_failure_ = true;
            retry_scheduled_ = false;
        } else {
            delay = retry_policy_.delay_for(retry_count_);
            retry_count_++;
            retry_deadline_ = DebounceTimer::Clock::now() + delay;
            retry_scheduled_ = true;
        }
        persistent = persistent_failure_;
        attempt = retry_count_;
    }

    if (persistent) {
        Logger::error("[WatchSession] Giving up on " + profile_.id + " after " +
                      std::to_string(retry_policy_.max_attempts) + " retries: " + reason);
    } else {
        Logger::warn("[WatchSession] " + profile_.id + ": " + reason + " (retry " + std::to_string(attempt) +
                     "/" + std::to_string(retry_policy_.max_attempts) + " in " +
                     std::to_string(delay.count()) + "ms)");
    }
    notify_state(WatchState::Error, reason, persistent);
}

void WatchSession::try_recover() {
    std::string error;
    if (!add_watches(error)) {
        enter_error(error);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != WatchState::Error) {
            return;
        }
        state_ = WatchState::Watching;
        retry_count_ = 0;
        retry_scheduled_ = false;
        last_error_.clear();
        // The tree may have changed while it was unwatched
        debounce_.reset(DebounceTimer::Clock::now());
    }

    Logger::info("[WatchSession] Resumed watching " + profile_.id);
    notify_state(WatchState::Watching, "", false);
}

void WatchSession::wake_locked() {
    if (wake_fd_ < 0) return;
    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        Logger::debug("[WatchSession] Wakeup write failed: " + std::string(strerror(errno)));
    }
}

int WatchSession::poll_timeout_ms() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = DebounceTimer::Clock::now();

    std::chrono::milliseconds timeout(MAX_POLL_MS);
    if (debounce_.armed()) {
        timeout = std::min(timeout, debounce_.remaining(now));
    }
    if (state_ == WatchState::Error && retry_scheduled_) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(retry_deadline_ - now);
        timeout = std::min(timeout, std::max(left, std::chrono::milliseconds(0)));
    }
    return static_cast<int>(timeout.count());
}

void WatchSession::notify_state(WatchState state, const std::string& error, bool persistent) {
    if (!state_callback_) return;
    try {
        state_callback_(profile_.id, state, error, persistent);
    } catch (const std::exception& e) {
        Logger::error("[WatchSession] State handler failed for " + profile_.id + ": " + e.what());
    }
}

void WatchSession::mark_pending_retrigger() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_retrigger_ = true;
    Logger::debug("[WatchSession] " + profile_.id + " busy, backup will re-run after the current one");
}

void WatchSession::on_operation_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_retrigger_) return;
    pending_retrigger_ = false;

    if (state_ == WatchState::Watching) {
        debounce_.reset(DebounceTimer::Clock::now());
        wake_locked();
        Logger::debug("[WatchSession] Starting a fresh debounce cycle for " + profile_.id);
    }
}

void WatchSession::cancel_debounce() {
    std::lock_guard<std::mutex> lock(mutex_);
    debounce_.cancel();
}

WatchState WatchSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool WatchSession::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == WatchState::Starting || state_ == WatchState::Watching || state_ == WatchState::Error;
}

bool WatchSession::persistent_failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return persistent_failure_;
}

bool WatchSession::debounce_armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return debounce_.armed();
}

bool WatchSession::pending_retrigger() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_retrigger_;
}

int WatchSession::retry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_count_;
}

std::string WatchSession::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace savekeeper

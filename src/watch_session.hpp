// watch_session.hpp - inotify watch with debounce for one entity
// Uses native Linux inotify API (kernel 2.6.13+, universally available)

#ifndef SAVEKEEPER_WATCH_SESSION_HPP
#define SAVEKEEPER_WATCH_SESSION_HPP

#include <string>
#include <functional>
#include <unordered_map>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>
#include "entity_profile.hpp"
#include "debounce_timer.hpp"

namespace savekeeper {

enum class WatchState {
    Stopped,
    Starting,
    Watching,
    Stopping,
    Error     // watches lost; retried with backoff until the budget runs out
};

std::string to_string(WatchState state);

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};

    // base * 2^attempt, capped at max_delay
    std::chrono::milliseconds delay_for(int attempt) const;
};

/**
 * WatchSession - turns filesystem activity under one entity's source path
 * into debounced backup triggers
 *
 * Each session owns an inotify descriptor with a watch on every directory
 * of the tree, and one thread that polls it. Creations, writes, renames
 * and attribute changes push the debounce deadline back; deletions are
 * logged and otherwise ignored. When the deadline passes the trigger
 * callback runs once, on the session thread.
 *
 * Callbacks are never invoked with the session's internal lock held, but
 * they must not call stop() on their own session.
 */
class WatchSession {
public:
    using TriggerCallback = std::function<void(const std::string& entity_id)>;
    using StateCallback = std::function<void(const std::string& entity_id, WatchState state,
                                             const std::string& error, bool persistent_failure)>;

    WatchSession(EntityProfile profile, RetryPolicy retry_policy);
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    // Set before start()
    void set_trigger_callback(TriggerCallback callback) { trigger_callback_ = std::move(callback); }
    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

    // No-op if already running. Returns false if the source could not be
    // watched; the session then sits in Error and keeps retrying.
    bool start();

    // No-op if already stopped. Cancels a pending debounce; does not wait for
    // backup work the trigger callback handed elsewhere.
    void stop();

    // A trigger arrived while an operation was running: debounce again after it
    void mark_pending_retrigger();
    void on_operation_finished();

    void cancel_debounce();

    WatchState state() const;
    bool is_running() const;
    bool persistent_failure() const;
    bool debounce_armed() const;
    bool pending_retrigger() const;
    int retry_count() const;
    std::string last_error() const;

    const std::string& entity_id() const { return profile_.id; }
    const EntityProfile& profile() const { return profile_; }

private:
    void watch_loop();

    bool add_watches(std::string& error);
    bool add_watch_recursive(const std::string& path, bool is_root, std::string& error);
    void remove_all_watches();
    void remove_watches_under(const std::string& path);

    // Returns true if the event should push the debounce deadline back
    bool handle_event(int wd, uint32_t mask, const char* name, std::string& failure);

    void enter_error(const std::string& reason);
    void try_recover();
    void wake_locked();  // mutex_ held; the descriptor is closed under it
    void notify_state(WatchState state, const std::string& error, bool persistent);
    int poll_timeout_ms();

    EntityProfile profile_;
    RetryPolicy retry_policy_;

    int inotify_fd_ = -1;
    int wake_fd_ = -1;
    int root_wd_ = -1;
    std::unordered_map<int, std::string> wd_to_path_;  // session thread only, after start

    TriggerCallback trigger_callback_;
    StateCallback state_callback_;

    std::thread thread_;
    std::atomic<bool> stop_requested_{false};
    std::mutex lifecycle_mutex_;  // serializes start/stop

    mutable std::mutex mutex_;    // guards everything below
    WatchState state_ = WatchState::Stopped;
    DebounceTimer debounce_;
    bool pending_retrigger_ = false;
    int retry_count_ = 0;
    bool retry_scheduled_ = false;
    DebounceTimer::Clock::time_point retry_deadline_{};
    bool persistent_failure_ = false;
    std::string last_error_;
};

} // namespace savekeeper

#endif // SAVEKEEPER_WATCH_SESSION_HPP

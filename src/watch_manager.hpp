#ifndef SAVEKEEPER_WATCH_MANAGER_HPP
#define SAVEKEEPER_WATCH_MANAGER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include "entity_profile.hpp"
#include "watch_session.hpp"
#include "snapshot_engine.hpp"
#include "restore_coordinator.hpp"
#include "backup_event.hpp"
#include "worker_pool.hpp"

namespace savekeeper {

struct ManagerOptions {
    size_t worker_threads = 2;
    std::chrono::milliseconds manual_wait{30000};
    RetryPolicy retry;
};

/**
 * WatchManager - owns one WatchSession per entity and routes their
 * triggers into the SnapshotEngine
 *
 * Automatic backups run on a small worker pool. While one is in flight
 * for an entity, further triggers only set the session's retrigger flag,
 * so a fresh debounce cycle starts once it finishes. Manual backups and
 * restores run on the calling thread after waiting (bounded) for the
 * running operation, so the caller gets a definite result.
 *
 * Events go to a single callback, never while the manager lock is held.
 */
class WatchManager {
public:
    using EventCallback = std::function<void(const BackupEvent& event)>;

    WatchManager(SnapshotEngine& engine, RestoreCoordinator& restorer, ManagerOptions options);
    ~WatchManager();

    WatchManager(const WatchManager&) = delete;
    WatchManager& operator=(const WatchManager&) = delete;

    void set_event_callback(EventCallback callback);

    // Rejects invalid profiles and duplicate ids; does not start watching
    bool add_entity(const EntityProfile& profile, std::string* error = nullptr);

    // Stops the session and waits for a running backup or restore
    bool remove_entity(const std::string& entity_id);

    // Starts every enabled entity; returns how many are watching.
    // An entity that fails to start only affects its own status.
    size_t start_all();
    void stop_all();

    bool start_watching(const std::string& entity_id);
    bool stop_watching(const std::string& entity_id);

    std::vector<Snapshot> list_snapshots(const std::string& entity_id) const;
    SnapshotResult request_manual_backup(const std::string& entity_id);
    RestoreResult request_restore(const std::string& entity_id, const std::string& snapshot_id);

    std::optional<BackupEvent> get_status(const std::string& entity_id) const;
    std::vector<std::string> entity_ids() const;
    uint64_t backup_size(const std::string& entity_id) const;

    // Stops all sessions and lets queued backups finish
    void shutdown();

private:
    struct Entity {
        EntityProfile profile;
        std::shared_ptr<WatchSession> session;
        bool in_flight = false;
        bool removing = false;
        bool restoring = false;
        // Explicit stop_watching/start_watching calls; a restore honours them when it resumes
        bool user_stopped = false;
        bool start_requested = false;
        BackupEvent status;
    };

    void on_trigger(const std::string& entity_id);
    void on_session_state(const std::string& entity_id, WatchState state,
                          const std::string& error, bool persistent);
    void run_automatic(const std::string& entity_id);

    // Waits for the entity's running operation; lock must hold mutex_
    bool wait_until_idle(std::unique_lock<std::mutex>& lock, const std::shared_ptr<Entity>& entity);
    void finish_operation(const std::string& entity_id, const std::function<void(Entity&)>& apply);
    EntityStatus resting_status(const Entity& entity) const;

    void emit(const BackupEvent& event);
    std::shared_ptr<Entity> find_locked(const std::string& entity_id) const;

    SnapshotEngine& engine_;
    RestoreCoordinator& restorer_;
    ManagerOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<std::string, std::shared_ptr<Entity>> entities_;
    bool shutting_down_ = false;

    std::mutex callback_mutex_;
    EventCallback event_callback_;

    WorkerPool pool_;
};

} // namespace savekeeper

#endif // SAVEKEEPER_WATCH_MANAGER_HPP

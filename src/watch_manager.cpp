#include "watch_manager.hpp"
#include "logger.hpp"

namespace savekeeper {

WatchManager::WatchManager(SnapshotEngine& engine, RestoreCoordinator& restorer, ManagerOptions options)
    : engine_(engine)
    , restorer_(restorer)
    , options_(options)
    , pool_(options.worker_threads, "backup") {
}

WatchManager::~WatchManager() {
    shutdown();
}

void WatchManager::set_event_callback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void WatchManager::emit(const BackupEvent& event) {
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (!callback) return;

    try {
        callback(event);
    } catch (const std::exception& e) {
        Logger::error("[WatchManager] Event handler failed for " + event.entity_id + ": " + e.what());
    }
}

std::shared_ptr<WatchManager::Entity> WatchManager::find_locked(const std::string& entity_id) const {
    auto it = entities_.find(entity_id);
    if (it == entities_.end()) return nullptr;
    return it->second;
}

EntityStatus WatchManager::resting_status(const Entity& entity) const {
    if (!entity.session) return EntityStatus::Idle;
    switch (entity.session->state()) {
        case WatchState::Watching:
        case WatchState::Starting:
            return EntityStatus::Watching;
        case WatchState::Error:
            return EntityStatus::Error;
        default:
            return EntityStatus::Idle;
    }
}

bool WatchManager::add_entity(const EntityProfile& profile, std::string* error) {
    std::string reason;
    if (!profile.isValid(&reason)) {
        Logger::error("[WatchManager] Rejected profile " + profile.id + ": " + reason);
        if (error) *error = reason;
        return false;
    }

    // Seed the status with what is already on disk
    auto existing = engine_.list(profile);

    auto entity = std::make_shared<Entity>();
    entity->profile = profile;
    entity->status.entity_id = profile.id;
    for (const auto& snapshot : existing) {
        if (snapshot.kind == SnapshotKind::Safety) continue;
        entity->status.last_backup_timestamp = snapshot.timestamp;
        entity->status.last_snapshot_id = snapshot.id;
        entity->status.last_snapshot_size = snapshot.size_bytes;
        break;  // newest first
    }

    entity->session = std::make_shared<WatchSession>(profile, options_.retry);
    entity->session->set_trigger_callback([this](const std::string& id) { on_trigger(id); });
    entity->session->set_state_callback(
        [this](const std::string& id, WatchState state, const std::string& err, bool persistent) {
            on_session_state(id, state, err, persistent);
        });

    BackupEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entities_.count(profile.id)) {
            Logger::error("[WatchManager] Duplicate entity id " + profile.id);
            if (error) *error = "duplicate entity id " + profile.id;
            return false;
        }
        entities_[profile.id] = entity;
        event = entity->status;
    }

    Logger::info("[WatchManager] Added entity " + profile.id + " (" + profile.source_path + ")");
    emit(event);
    return true;
}

bool WatchManager::remove_entity(const std::string& entity_id) {
    std::shared_ptr<Entity> entity;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entity = find_locked(entity_id);
        if (!entity || entity->removing) return false;
        entity->removing = true;
    }

    entity->session->stop();

    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [&entity] { return !entity->in_flight; });
        entities_.erase(entity_id);
    }

    Logger::info("[WatchManager] Removed entity " + entity_id);
    return true;
}

size_t WatchManager::start_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : entities_) {
            if (pair.second->profile.enabled) ids.push_back(pair.first);
        }
    }

    size_t started = 0;
    for (const auto& id : ids) {
        if (start_watching(id)) {
            started++;
        }
    }
    Logger::info("[WatchManager] Watching " + std::to_string(started) + " of " +
                 std::to_string(ids.size()) + " enabled entities");
    return started;
}

void WatchManager::stop_all() {
    std::vector<std::shared_ptr<WatchSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : entities_) {
            sessions.push_back(pair.second->session);
        }
    }
    for (auto& session : sessions) {
        session->stop();
    }
}

bool WatchManager::start_watching(const std::string& entity_id) {
    std::shared_ptr<WatchSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity || entity->removing || shutting_down_) return false;
        entity->user_stopped = false;
        if (entity->restoring) {
            // Watching resumes once the restore has swapped the tree
            entity->start_requested = true;
            return true;
        }
        session = entity->session;
    }

    if (!session->start()) {
        Logger::warn("[WatchManager] Could not start watching " + entity_id + ": " + session->last_error());
        return false;
    }
    return true;
}

bool WatchManager::stop_watching(const std::string& entity_id) {
    std::shared_ptr<WatchSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity) return false;
        entity->user_stopped = true;
        entity->start_requested = false;
        session = entity->session;
    }
    session->stop();
    return true;
}

void WatchManager::on_session_state(const std::string& entity_id, WatchState state,
                                    const std::string& error, bool persistent) {
    BackupEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity) return;

        if (state == WatchState::Error) {
            entity->status.last_error = error;
            entity->status.persistent_failure = persistent;
        } else if (state == WatchState::Watching) {
            entity->status.persistent_failure = false;
        }

        // A running operation reports its own status when it ends
        if (entity->in_flight) return;

        switch (state) {
            case WatchState::Watching: entity->status.status = EntityStatus::Watching; break;
            case WatchState::Error:    entity->status.status = EntityStatus::Error; break;
            case WatchState::Stopped:  entity->status.status = EntityStatus::Idle; break;
            default: return;
        }
        event = entity->status;
    }
    emit(event);
}

void WatchManager::on_trigger(const std::string& entity_id) {
    BackupEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity || entity->removing || shutting_down_) return;

        if (entity->in_flight) {
            entity->session->mark_pending_retrigger();
            return;
        }
        entity->in_flight = true;
        entity->status.status = EntityStatus::BackingUp;
        event = entity->status;
    }
    emit(event);

    if (!pool_.submit([this, entity_id] { run_automatic(entity_id); })) {
        Logger::error("[WatchManager] Worker pool unavailable, dropping backup of " + entity_id);
        finish_operation(entity_id, [](Entity& e) {
            e.status.status = EntityStatus::Error;
            e.status.last_error = "backup worker unavailable";
        });
    }
}

void WatchManager::run_automatic(const std::string& entity_id) {
    EntityProfile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity) return;
        profile = entity->profile;
    }

    SnapshotResult result = engine_.create(profile, SnapshotKind::Automatic);

    finish_operation(entity_id, [this, &result](Entity& e) {
        switch (result.status) {
            case SnapshotResult::Status::Created:
                e.status.last_backup_timestamp = result.snapshot->timestamp;
                e.status.last_snapshot_id = result.snapshot->id;
                e.status.last_snapshot_size = result.snapshot->size_bytes;
                if (!e.status.persistent_failure) e.status.last_error.clear();
                e.status.status = resting_status(e);
                break;
            case SnapshotResult::Status::Busy:
                // Lock held outside this manager; try again after another quiet period
                e.session->mark_pending_retrigger();
                e.status.status = resting_status(e);
                break;
            case SnapshotResult::Status::Failed:
                e.status.last_error = result.error;
                e.status.status = EntityStatus::Error;
                break;
        }
    });
}

bool WatchManager::wait_until_idle(std::unique_lock<std::mutex>& lock, const std::shared_ptr<Entity>& entity) {
    return idle_cv_.wait_for(lock, options_.manual_wait, [&entity] {
        return !entity->in_flight || entity->removing;
    });
}

void WatchManager::finish_operation(const std::string& entity_id, const std::function<void(Entity&)>& apply) {
    BackupEvent event;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (entity) {
            entity->in_flight = false;
            apply(*entity);
            entity->session->on_operation_finished();
            event = entity->status;
            found = true;
        }
    }
    idle_cv_.notify_all();
    if (found) emit(event);
}

SnapshotResult WatchManager::request_manual_backup(const std::string& entity_id) {
    SnapshotResult result;
    EntityProfile profile;
    BackupEvent event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity || entity->removing) {
            result.status = SnapshotResult::Status::Failed;
            result.error = "unknown entity " + entity_id;
            return result;
        }

        if (!wait_until_idle(lock, entity) || entity->removing) {
            // Runs once the current operation ends
            entity->session->mark_pending_retrigger();
            result.status = SnapshotResult::Status::Busy;
            result.error = "another operation is still running for " + entity_id;
            Logger::warn("[WatchManager] Manual backup of " + entity_id + " deferred: " + result.error);
            return result;
        }

        entity->in_flight = true;
        entity->session->cancel_debounce();
        entity->status.status = EntityStatus::BackingUp;
        profile = entity->profile;
        event = entity->status;
    }
    emit(event);

    Logger::info("[WatchManager] Manual backup requested for " + entity_id);
    result = engine_.create(profile, SnapshotKind::Manual, options_.manual_wait);

    finish_operation(entity_id, [this, &result](Entity& e) {
        if (result.ok()) {
            e.status.last_backup_timestamp = result.snapshot->timestamp;
            e.status.last_snapshot_id = result.snapshot->id;
            e.status.last_snapshot_size = result.snapshot->size_bytes;
            if (!e.status.persistent_failure) e.status.last_error.clear();
            e.status.status = resting_status(e);
        } else if (result.status == SnapshotResult::Status::Busy) {
            e.session->mark_pending_retrigger();
            e.status.status = resting_status(e);
        } else {
            e.status.last_error = result.error;
            e.status.status = EntityStatus::Error;
        }
    });
    return result;
}

RestoreResult WatchManager::request_restore(const std::string& entity_id, const std::string& snapshot_id) {
    RestoreResult result;
    EntityProfile profile;
    std::shared_ptr<WatchSession> session;
    BackupEvent event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity || entity->removing) {
            result.status = RestoreResult::Status::SnapshotMissing;
            result.error = "unknown entity " + entity_id;
            return result;
        }

        if (!wait_until_idle(lock, entity) || entity->removing) {
            result.status = RestoreResult::Status::Busy;
            result.error = "another operation is still running for " + entity_id;
            Logger::warn("[WatchManager] Restore of " + entity_id + " refused: " + result.error);
            return result;
        }

        entity->in_flight = true;
        entity->restoring = true;
        entity->start_requested = false;
        entity->status.status = EntityStatus::Restoring;
        profile = entity->profile;
        session = entity->session;
        event = entity->status;
    }
    emit(event);

    // The swap must not look like user activity
    bool was_running = session->is_running();
    session->stop();

    result = restorer_.restore(profile, snapshot_id, options_.manual_wait);

    bool resume = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (entity) {
            entity->restoring = false;
            resume = (was_running || entity->start_requested) && !entity->user_stopped &&
                     !entity->removing && !shutting_down_;
            entity->start_requested = false;
        }
    }
    if (resume) {
        session->start();
    }

    finish_operation(entity_id, [this, &result, &snapshot_id](Entity& e) {
        if (!result.safety_snapshot_id.empty()) {
            e.status.safety_snapshot_id = result.safety_snapshot_id;
        }
        if (result.ok()) {
            e.status.restored_snapshot_id = snapshot_id;
            if (!e.status.persistent_failure) e.status.last_error.clear();
            e.status.status = resting_status(e);
        } else {
            e.status.restored_snapshot_id.clear();
            e.status.last_error = result.error;
            e.status.status = EntityStatus::Error;
        }
    });
    return result;
}

std::vector<Snapshot> WatchManager::list_snapshots(const std::string& entity_id) const {
    EntityProfile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity) return {};
        profile = entity->profile;
    }
    return engine_.list(profile);
}

std::optional<BackupEvent> WatchManager::get_status(const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entity = find_locked(entity_id);
    if (!entity) return std::nullopt;
    return entity->status;
}

std::vector<std::string> WatchManager::entity_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& pair : entities_) {
        ids.push_back(pair.first);
    }
    return ids;
}

uint64_t WatchManager::backup_size(const std::string& entity_id) const {
    EntityProfile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entity = find_locked(entity_id);
        if (!entity) return 0;
        profile = entity->profile;
    }
    return engine_.backup_size(profile);
}

void WatchManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return;
        shutting_down_ = true;
    }
    Logger::info("[WatchManager] Shutting down");
    stop_all();
    pool_.shutdown();
}

} // namespace savekeeper

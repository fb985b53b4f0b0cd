#ifndef SAVEKEEPER_SNAPSHOT_ENGINE_HPP
#define SAVEKEEPER_SNAPSHOT_ENGINE_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <chrono>
#include <mutex>
#include "snapshot.hpp"
#include "entity_profile.hpp"
#include "entity_lock.hpp"

namespace savekeeper {

class SnapshotCatalog;

struct SnapshotResult {
    enum class Status {
        Created,
        Busy,    // another operation holds the entity lock
        Failed   // nothing was created, nothing was pruned
    };

    Status status = Status::Failed;
    std::optional<Snapshot> snapshot;
    std::string error;
    std::vector<std::string> pruned;              // ids removed by retention
    std::vector<std::string> retention_warnings;  // deletions that failed, retried next pass

    bool ok() const { return status == Status::Created; }
};

/**
 * SnapshotEngine - creates, lists and prunes an entity's backup copies
 *
 * Every mutating operation runs under the entity's lock from the shared
 * EntityLockTable. Artifacts are built under a ".staging-" name and only
 * renamed to their final name once complete, then older snapshots beyond
 * the profile's retention limit are pruned oldest first. Safety snapshots
 * live in their own subdirectory and have their own limit.
 *
 * Layout under {backup_root}/{entity}:
 *   .catalog.db                 SQLite catalog
 *   {id} | {id}.tar.gz          automatic and manual snapshots
 *   safety/{id}[.tar.gz]        safety snapshots
 */
class SnapshotEngine {
public:
    // Called with stage "begin" right after the lock is taken and "end" right before release
    using ProgressCallback = std::function<void(const std::string& entity_id, const std::string& stage)>;

    explicit SnapshotEngine(EntityLockTable& locks);

    // Non-blocking: Busy if another operation for the entity is running
    SnapshotResult create(const EntityProfile& profile, SnapshotKind kind);

    // Waits up to lock_wait for the entity lock
    SnapshotResult create(const EntityProfile& profile, SnapshotKind kind,
                          std::chrono::milliseconds lock_wait);

    // Caller already holds the entity lock. Retention never prunes keep_id.
    SnapshotResult create_locked(const EntityProfile& profile, SnapshotKind kind,
                                 const std::string& keep_id = std::string());

    // Complete snapshots of all kinds, newest first. Read-only, takes no lock.
    std::vector<Snapshot> list(const EntityProfile& profile) const;

    std::optional<Snapshot> find(const EntityProfile& profile, const std::string& snapshot_id) const;

    // Exists, complete and the artifact digest still matches the catalog
    bool verify(const Snapshot& snapshot, std::string& error) const;

    // Writes the snapshot's tree to dest, which must not exist yet
    bool materialize(const Snapshot& snapshot, const std::filesystem::path& dest,
                     std::string& error) const;

    // Bytes used by all of the entity's backups
    uint64_t backup_size(const EntityProfile& profile) const;

    void set_progress_callback(ProgressCallback callback);

    EntityLockTable& locks() { return locks_; }

    static std::filesystem::path entity_dir(const EntityProfile& profile);
    static std::filesystem::path safety_dir(const EntityProfile& profile);
    static std::filesystem::path catalog_path(const EntityProfile& profile);

private:
    // Brings catalog and disk back in sync after a crash or manual tampering
    void reconcile(const EntityProfile& profile, SnapshotCatalog& catalog);
    void prune(const EntityProfile& profile, SnapshotCatalog& catalog, bool safety_class,
               const std::string& keep_id, SnapshotResult& result);
    void report(const std::string& entity_id, const std::string& stage);

    EntityLockTable& locks_;

    std::mutex callback_mutex_;
    ProgressCallback progress_callback_;
};

} // namespace savekeeper

#endif // SAVEKEEPER_SNAPSHOT_ENGINE_HPP

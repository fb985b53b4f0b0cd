#ifndef SAVEKEEPER_RESTORE_COORDINATOR_HPP
#define SAVEKEEPER_RESTORE_COORDINATOR_HPP

#include <string>
#include <chrono>
#include <filesystem>
#include "snapshot_engine.hpp"

namespace savekeeper {

struct RestoreResult {
    enum class Status {
        Restored,
        Busy,             // entity lock not obtained in time
        SnapshotMissing,  // unknown id, incomplete, or artifact gone
        SnapshotCorrupt,  // digest mismatch or unreadable artifact
        SafetyFailed,     // could not back up the live state, nothing touched
        StagingFailed,    // live state untouched
        SwapFailed        // see reinstated
    };

    Status status = Status::StagingFailed;
    std::string error;
    std::string safety_snapshot_id;
    // SwapFailed only: true if the live path holds its pre-restore content again
    bool reinstated = false;

    bool ok() const { return status == Status::Restored; }
};

std::string to_string(RestoreResult::Status status);

/**
 * RestoreCoordinator - replaces an entity's live tree with a snapshot
 *
 * Under the entity lock: verify the snapshot, take a safety snapshot of
 * the live tree, stage the snapshot next to the live path, then swap the
 * two with renameat2(RENAME_EXCHANGE). Files in the live tree that are not
 * in the snapshot are gone afterwards (mirror semantics), but they remain
 * in the safety snapshot.
 */
class RestoreCoordinator {
public:
    explicit RestoreCoordinator(SnapshotEngine& engine);

    RestoreResult restore(const EntityProfile& profile, const std::string& snapshot_id,
                          std::chrono::milliseconds lock_wait);

    // Disables RENAME_EXCHANGE so tests can drive the two-rename path
    void set_exchange_enabled(bool enabled) { exchange_enabled_ = enabled; }

private:
    RestoreResult restore_locked(const EntityProfile& profile, const std::string& snapshot_id);

    // Returns true once the staged tree is at the live path; old_tree is then
    // wherever the previous live tree ended up (empty if there was none)
    bool swap_into_place(const std::filesystem::path& staged, const std::filesystem::path& live,
                         bool live_exists, std::filesystem::path& old_tree, RestoreResult& result);

    bool reinstate_safety(const EntityProfile& profile, const std::filesystem::path& live,
                          RestoreResult& result);

    SnapshotEngine& engine_;
    bool exchange_enabled_ = true;
};

} // namespace savekeeper

#endif // SAVEKEEPER_RESTORE_COORDINATOR_HPP

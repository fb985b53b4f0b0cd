#include "restore_coordinator.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fcntl.h>

namespace fs = std::filesystem;

namespace savekeeper {

std::string to_string(RestoreResult::Status status) {
    switch (status) {
        case RestoreResult::Status::Restored:        return "restored";
        case RestoreResult::Status::Busy:            return "busy";
        case RestoreResult::Status::SnapshotMissing: return "snapshot missing";
        case RestoreResult::Status::SnapshotCorrupt: return "snapshot corrupt";
        case RestoreResult::Status::SafetyFailed:    return "safety snapshot failed";
        case RestoreResult::Status::StagingFailed:   return "staging failed";
        case RestoreResult::Status::SwapFailed:      return "swap failed";
    }
    return "unknown";
}

static fs::path live_path_of(const EntityProfile& profile) {
    fs::path live = fs::path(profile.source_path).lexically_normal();
    if (live.filename().empty()) live = live.parent_path();  // trailing slash
    return live;
}

// Hidden sibling of the live path, on the same filesystem so renames stay atomic
static fs::path sibling_path(const fs::path& live, const std::string& tag, const std::string& id) {
    return live.parent_path() / ("." + live.filename().string() + "." + tag + "-" + id);
}

RestoreCoordinator::RestoreCoordinator(SnapshotEngine& engine)
    : engine_(engine) {
}

RestoreResult RestoreCoordinator::restore(const EntityProfile& profile, const std::string& snapshot_id,
                                          std::chrono::milliseconds lock_wait) {
    auto guard = engine_.locks().acquire(profile.id, lock_wait);
    if (!guard) {
        RestoreResult result;
        result.status = RestoreResult::Status::Busy;
        result.error = "timed out waiting for the running operation on " + profile.id;
        Logger::warn("[RestoreCoordinator] " + result.error);
        return result;
    }
    return restore_locked(profile, snapshot_id);
}

RestoreResult RestoreCoordinator::restore_locked(const EntityProfile& profile, const std::string& snapshot_id) {
    RestoreResult result;
    auto fail = [&](RestoreResult::Status status, const std::string& error) {
        result.status = status;
        result.error = error;
        Logger::error("[RestoreCoordinator] Restore of " + profile.id + " to " + snapshot_id +
                      " failed: " + error);
        return result;
    };

    // 1. The chosen snapshot must be intact before anything is touched
    auto snapshot = engine_.find(profile, snapshot_id);
    if (!snapshot || !snapshot->complete) {
        return fail(RestoreResult::Status::SnapshotMissing, "no complete snapshot " + snapshot_id);
    }
    if (!fsutil::safe_exists(snapshot->location)) {
        return fail(RestoreResult::Status::SnapshotMissing,
                    "snapshot " + snapshot_id + " is missing at " + snapshot->location);
    }
    std::string error;
    if (!engine_.verify(*snapshot, error)) {
        return fail(RestoreResult::Status::SnapshotCorrupt, error);
    }

    const fs::path live = live_path_of(profile);
    const bool live_exists = !fsutil::safe_definitely_missing(live);
    if (live_exists && !fsutil::safe_is_directory(live)) {
        return fail(RestoreResult::Status::StagingFailed, "live path is not a directory: " + live.string());
    }

    // 2. Safety snapshot of the current live state. The restore target may be
    //    an older safety snapshot and must survive the safety retention pass.
    Logger::info("[RestoreCoordinator] Restoring " + profile.id + " to " + snapshot_id);
    SnapshotResult safety = engine_.create_locked(profile, SnapshotKind::Safety, snapshot_id);
    if (!safety.ok() || !safety.snapshot) {
        return fail(RestoreResult::Status::SafetyFailed, "safety snapshot failed: " + safety.error);
    }
    result.safety_snapshot_id = safety.snapshot->id;

    // 3. Stage next to the live path
    const fs::path staged = sibling_path(live, "restore", snapshot_id);
    if (!fsutil::remove_tree(staged, error)) {
        return fail(RestoreResult::Status::StagingFailed, error);
    }
    std::error_code ec;
    fs::create_directories(live.parent_path(), ec);
    if (ec) {
        return fail(RestoreResult::Status::StagingFailed,
                    "cannot create " + live.parent_path().string() + ": " + ec.message());
    }
    if (!engine_.materialize(*snapshot, staged, error)) {
        std::string cleanup_error;
        if (!fsutil::remove_tree(staged, cleanup_error)) {
            Logger::warn("[RestoreCoordinator] " + cleanup_error);
        }
        return fail(RestoreResult::Status::StagingFailed, "cannot stage snapshot: " + error);
    }

    // 4. Swap
    fs::path old_tree;
    if (!swap_into_place(staged, live, live_exists, old_tree, result)) {
        std::string cleanup_error;
        if (fsutil::safe_exists(staged) && !fsutil::remove_tree(staged, cleanup_error)) {
            Logger::warn("[RestoreCoordinator] " + cleanup_error);
        }
        if (result.status == RestoreResult::Status::SwapFailed && !result.reinstated) {
            reinstate_safety(profile, live, result);
        }
        Logger::error("[RestoreCoordinator] Restore of " + profile.id + " failed: " + result.error);
        return result;
    }

    if (!old_tree.empty() && !fsutil::remove_tree(old_tree, error)) {
        // Content is already in the safety snapshot
        Logger::warn("[RestoreCoordinator] Could not remove previous tree: " + error);
    }

    Logger::info("[RestoreCoordinator] Restored " + profile.id + " to " + snapshot_id +
                 " (safety snapshot " + result.safety_snapshot_id + ")");
    result.status = RestoreResult::Status::Restored;
    result.error.clear();
    return result;
}

bool RestoreCoordinator::swap_into_place(const fs::path& staged, const fs::path& live, bool live_exists,
                                         fs::path& old_tree, RestoreResult& result) {
    std::error_code ec;

    if (!live_exists) {
        fs::rename(staged, live, ec);
        if (ec) {
            result.status = RestoreResult::Status::StagingFailed;
            result.error = "cannot move staged tree into place: " + ec.message();
            return false;
        }
        return true;
    }

    if (exchange_enabled_) {
        if (renameat2(AT_FDCWD, staged.c_str(), AT_FDCWD, live.c_str(), RENAME_EXCHANGE) == 0) {
            old_tree = staged;  // holds the previous live tree now
            return true;
        }
        int err = errno;
        if (err != EINVAL && err != ENOSYS && err != ENOTSUP && err != EOPNOTSUPP) {
            result.status = RestoreResult::Status::StagingFailed;
            result.error = std::string("atomic exchange failed: ") + std::strerror(err);
            return false;
        }
        Logger::debug("[RestoreCoordinator] RENAME_EXCHANGE unsupported here, using two renames");
    }

    const fs::path aside = sibling_path(live, "aside", result.safety_snapshot_id);
    std::string error;
    if (!fsutil::remove_tree(aside, error)) {
        result.status = RestoreResult::Status::StagingFailed;
        result.error = error;
        return false;
    }

    fs::rename(live, aside, ec);
    if (ec) {
        result.status = RestoreResult::Status::StagingFailed;
        result.error = "cannot move live tree aside: " + ec.message();
        return false;
    }

    fs::rename(staged, live, ec);
    if (!ec) {
        old_tree = aside;
        return true;
    }

    // Mid-swap: the live path is empty right now
    result.status = RestoreResult::Status::SwapFailed;
    result.error = "cannot move staged tree into place: " + ec.message();

    std::error_code back_ec;
    fs::rename(aside, live, back_ec);
    if (!back_ec) {
        Logger::warn("[RestoreCoordinator] Swap failed, previous tree moved back");
        result.reinstated = true;
    } else {
        Logger::error("[RestoreCoordinator] Cannot move previous tree back: " + back_ec.message());
    }
    return false;
}

bool RestoreCoordinator::reinstate_safety(const EntityProfile& profile, const fs::path& live,
                                          RestoreResult& result) {
    auto safety = engine_.find(profile, result.safety_snapshot_id);
    if (!safety) {
        Logger::error("[RestoreCoordinator] Safety snapshot " + result.safety_snapshot_id + " not found");
        return false;
    }

    std::string error;
    if (!fsutil::remove_tree(live, error) || !engine_.materialize(*safety, live, error)) {
        Logger::error("[RestoreCoordinator] Cannot reinstate safety snapshot " + safety->id + ": " + error +
                      ". Live data is preserved in " + safety->location);
        return false;
    }

    Logger::warn("[RestoreCoordinator] Reinstated safety snapshot " + safety->id + " into " + live.string());
    result.reinstated = true;
    return true;
}

} // namespace savekeeper

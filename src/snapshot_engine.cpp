#include "snapshot_engine.hpp"
#include "snapshot_catalog.hpp"
#include "archive_codec.hpp"
#include "digest.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <map>

namespace fs = std::filesystem;

namespace savekeeper {

static const char* STAGING_PREFIX = ".staging-";

static std::string artifact_name(const std::string& id, SnapshotFormat format) {
    return format == SnapshotFormat::Archive ? id + ARCHIVE_EXTENSION : id;
}

SnapshotEngine::SnapshotEngine(EntityLockTable& locks)
    : locks_(locks) {
}

fs::path SnapshotEngine::entity_dir(const EntityProfile& profile) {
    return fs::path(profile.backup_root) / profile.id;
}

fs::path SnapshotEngine::safety_dir(const EntityProfile& profile) {
    return entity_dir(profile) / "safety";
}

fs::path SnapshotEngine::catalog_path(const EntityProfile& profile) {
    return entity_dir(profile) / ".catalog.db";
}

void SnapshotEngine::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback_ = std::move(callback);
}

void SnapshotEngine::report(const std::string& entity_id, const std::string& stage) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = progress_callback_;
    }
    if (callback) {
        callback(entity_id, stage);
    }
}

SnapshotResult SnapshotEngine::create(const EntityProfile& profile, SnapshotKind kind) {
    auto guard = locks_.try_acquire(profile.id);
    if (!guard) {
        Logger::debug("[SnapshotEngine] " + profile.id + " is busy, skipping " + to_string(kind) + " snapshot");
        SnapshotResult result;
        result.status = SnapshotResult::Status::Busy;
        result.error = "another operation is running for " + profile.id;
        return result;
    }
    return create_locked(profile, kind);
}

SnapshotResult SnapshotEngine::create(const EntityProfile& profile, SnapshotKind kind,
                                      std::chrono::milliseconds lock_wait) {
    auto guard = locks_.acquire(profile.id, lock_wait);
    if (!guard) {
        Logger::warn("[SnapshotEngine] Timed out waiting for " + profile.id);
        SnapshotResult result;
        result.status = SnapshotResult::Status::Busy;
        result.error = "timed out waiting for the running operation on " + profile.id;
        return result;
    }
    return create_locked(profile, kind);
}

SnapshotResult SnapshotEngine::create_locked(const EntityProfile& profile, SnapshotKind kind,
                                             const std::string& keep_id) {
    SnapshotResult result;
    report(profile.id, "begin");

    auto fail = [&](const std::string& error) {
        Logger::error("[SnapshotEngine] " + to_string(kind) + " snapshot of " + profile.id +
                      " failed: " + error);
        result.status = SnapshotResult::Status::Failed;
        result.error = error;
        report(profile.id, "end");
        return result;
    };

    const fs::path source(profile.source_path);
    bool empty_source = false;
    if (!fsutil::safe_is_directory(source)) {
        // A restore into a missing live path still records what was there: nothing
        if (kind == SnapshotKind::Safety && fsutil::safe_definitely_missing(source)) {
            empty_source = true;
        } else {
            return fail("source path is missing or not a directory: " + profile.source_path);
        }
    }

    const fs::path target_dir = kind == SnapshotKind::Safety ? safety_dir(profile) : entity_dir(profile);
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        return fail("cannot create " + target_dir.string() + ": " + ec.message());
    }

    SnapshotCatalog catalog(profile.id, catalog_path(profile).string());
    if (!catalog.open()) {
        return fail("cannot open catalog: " + catalog.last_error());
    }

    reconcile(profile, catalog);

    std::optional<SnapshotTime> newest;
    for (const auto& existing : catalog.load_all()) {
        if (!newest || existing.timestamp > *newest) newest = existing.timestamp;
    }

    Snapshot snapshot;
    snapshot.entity_id = profile.id;
    snapshot.timestamp = next_snapshot_time(snapshot_now(), newest);
    snapshot.id = format_snapshot_id(snapshot.timestamp);
    snapshot.kind = kind;
    snapshot.format = (profile.compression == CompressionMode::Archive && !empty_source)
                          ? SnapshotFormat::Archive : SnapshotFormat::Directory;
    snapshot.location = (target_dir / artifact_name(snapshot.id, snapshot.format)).string();

    const fs::path staging = target_dir / (STAGING_PREFIX + artifact_name(snapshot.id, snapshot.format));

    if (!catalog.insert_pending(snapshot)) {
        return fail("cannot record snapshot: " + catalog.last_error());
    }

    auto discard = [&](const std::string& error) {
        std::string cleanup_error;
        if (!fsutil::remove_tree(staging, cleanup_error)) {
            Logger::warn("[SnapshotEngine] " + cleanup_error);
        }
        if (!catalog.remove(snapshot.id)) {
            Logger::warn("[SnapshotEngine] Could not drop pending row " + snapshot.id + ": " +
                         catalog.last_error());
        }
        return fail(error);
    };

    Logger::info("[SnapshotEngine] Creating " + to_string(kind) + " snapshot " + snapshot.id +
                 " for " + profile.id);

    std::string error;
    bool copied = false;
    if (empty_source) {
        copied = fs::create_directory(staging, ec);
        if (!copied) error = "cannot create " + staging.string() + ": " + ec.message();
    } else if (snapshot.format == SnapshotFormat::Archive) {
        // Read the archive back before it can become a restore source
        copied = archive_codec::write_tar_gz(source, staging, error) &&
                 archive_codec::verify_readable(staging, error);
    } else {
        copied = fsutil::copy_tree(source, staging, error);
    }
    if (!copied) {
        return discard(error);
    }

    snapshot.digest = digest::sha256_artifact(staging, snapshot.format, error);
    if (snapshot.digest.empty()) {
        return discard("cannot hash staged copy: " + error);
    }
    snapshot.size_bytes = fsutil::tree_size(staging);

    fs::rename(staging, snapshot.location, ec);
    if (ec) {
        return discard("cannot move snapshot into place: " + ec.message());
    }

    snapshot.complete = true;
    if (!catalog.mark_complete(snapshot.id, snapshot.size_bytes, snapshot.digest)) {
        // The artifact is whole; the next locked operation completes the row
        Logger::warn("[SnapshotEngine] Snapshot " + snapshot.id + " saved but catalog not updated: " +
                     catalog.last_error());
    }

    Logger::info("[SnapshotEngine] Snapshot " + snapshot.id + " complete (" +
                 fsutil::format_file_size(snapshot.size_bytes) + ")");

    result.status = SnapshotResult::Status::Created;
    result.snapshot = snapshot;

    prune(profile, catalog, kind == SnapshotKind::Safety, keep_id, result);

    report(profile.id, "end");
    return result;
}

void SnapshotEngine::reconcile(const EntityProfile& profile, SnapshotCatalog& catalog) {
    struct Found {
        fs::path path;
        SnapshotFormat format;
        SnapshotKind kind;
    };
    std::map<std::string, Found> on_disk;

    for (const auto& dir : {entity_dir(profile), safety_dir(profile)}) {
        if (!fsutil::safe_is_directory(dir)) continue;

        const bool is_safety = dir == safety_dir(profile);
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();

            if (name.rfind(STAGING_PREFIX, 0) == 0) {
                std::string error;
                if (fsutil::remove_tree(it->path(), error)) {
                    Logger::info("[SnapshotEngine] Removed leftover staging " + it->path().string());
                } else {
                    Logger::warn("[SnapshotEngine] " + error);
                }
                continue;
            }

            auto id = snapshot_id_from_filename(name);
            if (!id) continue;

            bool archive = name.size() > id->size();
            std::error_code type_ec;
            if (archive ? !it->is_regular_file(type_ec) : !it->is_directory(type_ec)) continue;

            on_disk[*id] = Found{it->path(),
                                 archive ? SnapshotFormat::Archive : SnapshotFormat::Directory,
                                 is_safety ? SnapshotKind::Safety : SnapshotKind::Automatic};
        }
    }

    std::map<std::string, bool> catalogued;
    for (const auto& row : catalog.load_all()) {
        catalogued[row.id] = true;

        if (!fsutil::safe_exists(row.location)) {
            Logger::warn("[SnapshotEngine] Snapshot " + row.id + " of " + profile.id +
                         " vanished from disk, dropping it");
            if (!catalog.remove(row.id)) {
                Logger::warn("[SnapshotEngine] " + catalog.last_error());
            }
            continue;
        }

        if (!row.complete) {
            std::string error;
            std::string sum = digest::sha256_artifact(row.location, row.format, error);
            if (sum.empty()) {
                Logger::warn("[SnapshotEngine] Cannot recover snapshot " + row.id + ": " + error);
                continue;
            }
            if (catalog.mark_complete(row.id, fsutil::tree_size(row.location), sum)) {
                Logger::info("[SnapshotEngine] Recovered snapshot " + row.id + " of " + profile.id);
            }
        }
    }

    for (const auto& entry : on_disk) {
        if (catalogued.count(entry.first)) continue;

        auto timestamp = parse_snapshot_id(entry.first);
        if (!timestamp) continue;

        std::string error;
        Snapshot adopted;
        adopted.entity_id = profile.id;
        adopted.id = entry.first;
        adopted.timestamp = *timestamp;
        adopted.kind = entry.second.kind;
        adopted.format = entry.second.format;
        adopted.location = entry.second.path.string();
        adopted.size_bytes = fsutil::tree_size(entry.second.path);
        adopted.digest = digest::sha256_artifact(entry.second.path, adopted.format, error);
        if (adopted.digest.empty()) {
            Logger::warn("[SnapshotEngine] Cannot adopt " + adopted.location + ": " + error);
            continue;
        }
        if (catalog.insert_complete(adopted)) {
            Logger::info("[SnapshotEngine] Adopted uncatalogued snapshot " + adopted.id + " of " + profile.id);
        }
    }
}

void SnapshotEngine::prune(const EntityProfile& profile, SnapshotCatalog& catalog, bool safety_class,
                           const std::string& keep_id, SnapshotResult& result) {
    std::vector<Snapshot> candidates;
    for (auto& row : catalog.load_all()) {
        if (!row.complete) continue;
        if ((row.kind == SnapshotKind::Safety) != safety_class) continue;
        if (!keep_id.empty() && row.id == keep_id) continue;
        candidates.push_back(std::move(row));
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const Snapshot& a, const Snapshot& b) { return a.timestamp < b.timestamp; });

    const size_t limit = static_cast<size_t>(safety_class ? profile.safety_retention
                                                          : profile.retention_limit);
    if (candidates.size() <= limit) return;

    const size_t excess = candidates.size() - limit;
    for (size_t i = 0; i < excess; i++) {
        const Snapshot& old = candidates[i];

        std::string error;
        if (!fsutil::remove_tree(old.location, error)) {
            Logger::warn("[SnapshotEngine] Retention: " + error);
            result.retention_warnings.push_back(error);
            continue;
        }
        if (!catalog.remove(old.id)) {
            // The artifact is gone; reconcile drops the row next time
            Logger::warn("[SnapshotEngine] Retention: catalog row " + old.id + " kept: " + catalog.last_error());
        }
        Logger::info("[SnapshotEngine] Pruned " + to_string(old.kind) + " snapshot " + old.id +
                     " of " + profile.id);
        result.pruned.push_back(old.id);
    }
}

std::vector<Snapshot> SnapshotEngine::list(const EntityProfile& profile) const {
    std::vector<Snapshot> result;
    if (!fsutil::safe_is_directory(entity_dir(profile))) {
        return result;
    }

    SnapshotCatalog catalog(profile.id, catalog_path(profile).string());
    if (!catalog.open()) {
        Logger::error("[SnapshotEngine] Cannot list " + profile.id + ": " + catalog.last_error());
        return result;
    }

    for (auto& row : catalog.load_all()) {
        if (row.complete && fsutil::safe_exists(row.location)) {
            result.push_back(std::move(row));
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Snapshot& a, const Snapshot& b) { return a.timestamp > b.timestamp; });
    return result;
}

std::optional<Snapshot> SnapshotEngine::find(const EntityProfile& profile, const std::string& snapshot_id) const {
    if (!fsutil::safe_is_directory(entity_dir(profile))) {
        return std::nullopt;
    }

    SnapshotCatalog catalog(profile.id, catalog_path(profile).string());
    if (!catalog.open()) {
        return std::nullopt;
    }
    return catalog.find(snapshot_id);
}

bool SnapshotEngine::verify(const Snapshot& snapshot, std::string& error) const {
    if (!snapshot.complete) {
        error = "snapshot " + snapshot.id + " is incomplete";
        return false;
    }
    if (!fsutil::safe_exists(snapshot.location)) {
        error = "snapshot " + snapshot.id + " is missing at " + snapshot.location;
        return false;
    }
    if (snapshot.format == SnapshotFormat::Archive && !fsutil::safe_is_regular_file(snapshot.location)) {
        error = "snapshot " + snapshot.id + " is not an archive file: " + snapshot.location;
        return false;
    }

    std::string digest_error;
    std::string actual = digest::sha256_artifact(snapshot.location, snapshot.format, digest_error);
    if (actual.empty()) {
        error = "snapshot " + snapshot.id + " is unreadable: " + digest_error;
        return false;
    }
    if (actual != snapshot.digest) {
        error = "snapshot " + snapshot.id + " is corrupt (digest mismatch)";
        return false;
    }
    return true;
}

bool SnapshotEngine::materialize(const Snapshot& snapshot, const fs::path& dest, std::string& error) const {
    if (!fsutil::safe_definitely_missing(dest)) {
        error = "destination already exists: " + dest.string();
        return false;
    }

    if (snapshot.format == SnapshotFormat::Archive) {
        return archive_codec::extract_tar_gz(snapshot.location, dest, error);
    }
    return fsutil::copy_tree(snapshot.location, dest, error);
}

uint64_t SnapshotEngine::backup_size(const EntityProfile& profile) const {
    return fsutil::tree_size(entity_dir(profile));
}

} // namespace savekeeper

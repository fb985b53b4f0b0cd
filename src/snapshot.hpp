#ifndef SAVEKEEPER_SNAPSHOT_HPP
#define SAVEKEEPER_SNAPSHOT_HPP

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace savekeeper {

enum class SnapshotKind {
    Automatic,  // debounced change trigger
    Manual,     // user-requested
    Safety      // taken right before a restore, outside the retention count
};

enum class SnapshotFormat {
    Directory,
    Archive
};

std::string to_string(SnapshotKind kind);
std::optional<SnapshotKind> parse_snapshot_kind(const std::string& value);
std::string to_string(SnapshotFormat format);
std::optional<SnapshotFormat> parse_snapshot_format(const std::string& value);

using SnapshotClock = std::chrono::system_clock;
using SnapshotTime = std::chrono::time_point<SnapshotClock, std::chrono::microseconds>;

/**
 * Snapshot - one immutable backup copy of an entity's source tree
 *
 * The id is the UTC creation time "YYYYMMDD_HHMMSS_uuuuuu", which sorts
 * lexicographically in creation order and names the artifact on disk:
 *   {backup_root}/{entity}/{id}            directory snapshot
 *   {backup_root}/{entity}/{id}.tar.gz     archive snapshot
 *   {backup_root}/{entity}/safety/{id}...  safety snapshots
 */
struct Snapshot {
    std::string entity_id;
    std::string id;
    SnapshotTime timestamp{};
    SnapshotKind kind = SnapshotKind::Automatic;
    SnapshotFormat format = SnapshotFormat::Directory;
    std::string location;
    uint64_t size_bytes = 0;
    std::string digest;   // SHA-256 hex of the artifact content
    bool complete = false;

    bool counts_toward_retention() const { return kind != SnapshotKind::Safety; }
};

// Archive snapshots carry this suffix after the id
constexpr const char* ARCHIVE_EXTENSION = ".tar.gz";

std::string format_snapshot_id(SnapshotTime time);
std::optional<SnapshotTime> parse_snapshot_id(const std::string& id);

// Strips ARCHIVE_EXTENSION if present and parses the remainder as a snapshot id
std::optional<std::string> snapshot_id_from_filename(const std::string& filename);

// First id that is at or after now and strictly later than newest_existing
SnapshotTime next_snapshot_time(SnapshotTime now, std::optional<SnapshotTime> newest_existing);

SnapshotTime snapshot_now();

// Human readable local time for listings ("2024-01-15 10:30:00")
std::string format_local_time(SnapshotTime time);

} // namespace savekeeper

#endif // SAVEKEEPER_SNAPSHOT_HPP

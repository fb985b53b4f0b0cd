#ifndef SAVEKEEPER_BACKUP_EVENT_HPP
#define SAVEKEEPER_BACKUP_EVENT_HPP

#include <string>
#include <cstdint>
#include <optional>
#include "snapshot.hpp"

namespace savekeeper {

enum class EntityStatus {
    Idle,
    Watching,
    BackingUp,
    Restoring,
    Error
};

std::string to_string(EntityStatus status);

// Status update for one entity, delivered to the UI/notification side
struct BackupEvent {
    std::string entity_id;
    EntityStatus status = EntityStatus::Idle;
    std::optional<SnapshotTime> last_backup_timestamp;
    std::string last_error;
    bool persistent_failure = false;   // watch retry budget exhausted, needs the user
    std::string last_snapshot_id;
    uint64_t last_snapshot_size = 0;
    std::string safety_snapshot_id;    // set by the most recent restore
    std::string restored_snapshot_id;  // target of the most recent restore, empty if it failed
};

} // namespace savekeeper

#endif // SAVEKEEPER_BACKUP_EVENT_HPP

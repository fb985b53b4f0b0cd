#include "backup_event.hpp"

namespace savekeeper {

std::string to_string(EntityStatus status) {
    switch (status) {
        case EntityStatus::Idle:      return "idle";
        case EntityStatus::Watching:  return "watching";
        case EntityStatus::BackingUp: return "backing-up";
        case EntityStatus::Restoring: return "restoring";
        case EntityStatus::Error:     return "error";
    }
    return "unknown";
}

} // namespace savekeeper

#ifndef SAVEKEEPER_ENTITY_PROFILE_HPP
#define SAVEKEEPER_ENTITY_PROFILE_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <mutex>

namespace savekeeper {

class SettingsManager;

enum class CompressionMode {
    DirectoryCopy,  // snapshot is a directory mirroring the source tree
    Archive         // snapshot is a single .tar.gz file
};

std::string to_string(CompressionMode mode);
std::optional<CompressionMode> parse_compression_mode(const std::string& value);

/**
 * EntityProfile - static description of one monitored save location
 *
 *   - id: stable identifier, also the directory name under the backup root
 *   - source_path: live save directory being protected
 *   - backup_root: directory that receives {id}/ snapshot folders
 *   - retention_limit: automatic + manual snapshots kept (oldest pruned first)
 *   - safety_retention: pre-restore safety snapshots kept, counted separately
 *   - debounce_window: quiet period after the last change before a backup
 *
 * Profiles are passed by value into the engine and never change for the
 * lifetime of a watch session.
 */
struct EntityProfile {
    std::string id;
    std::string display_name;
    std::string source_path;
    std::string backup_root;
    int retention_limit = 50;
    int safety_retention = 5;
    std::chrono::milliseconds debounce_window{3000};
    CompressionMode compression = CompressionMode::DirectoryCopy;
    bool enabled = true;

    // Checks the invariants the engine relies on; reason receives the first violation
    bool isValid(std::string* reason = nullptr) const;

    std::string toJson() const;

    // Parses one JSON object; optional fields fall back to the application defaults
    static std::optional<EntityProfile> fromJson(const std::string& json,
                                                 const SettingsManager& defaults);
};

/**
 * ProfileRegistry - file-backed list of entity profiles
 *
 * Stored as a JSON array in ~/.config/savekeeper/profiles.json. The engine
 * only ever reads from it; edits come from the CLI or an external UI.
 */
class ProfileRegistry {
public:
    explicit ProfileRegistry(std::string config_path);

    static std::string defaultPath();

    bool loadProfiles(const SettingsManager& defaults);
    bool saveProfiles() const;

    std::optional<EntityProfile> getProfile(const std::string& id) const;
    std::vector<EntityProfile> getAllProfiles() const;

    // Inserts or replaces the profile with the same id
    void upsertProfile(const EntityProfile& profile);
    bool removeProfile(const std::string& id);

    const std::string& path() const { return config_path_; }

private:
    std::string config_path_;
    std::vector<EntityProfile> profiles_;
    mutable std::mutex mutex_;
};

} // namespace savekeeper

#endif // SAVEKEEPER_ENTITY_PROFILE_HPP

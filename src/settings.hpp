#pragma once

#include <string>
#include <map>
#include <mutex>
#include <functional>

namespace savekeeper {

/**
 * Application Settings Manager
 *
 * Holds the application-wide defaults the backup engine is built from:
 * - Backup location and retention defaults
 * - Debounce and compression defaults
 * - Watch retry policy and worker pool size
 * - Notification and logging preferences
 *
 * Settings are persisted to ~/.config/savekeeper/settings.json as a flat
 * JSON object of key/value pairs.
 */
class SettingsManager {
public:
    static SettingsManager& getInstance();

    // Standalone instance bound to an explicit file (used by the CLI --config flag and tests)
    explicit SettingsManager(const std::string& config_path);
    ~SettingsManager() = default;

    // Load/save settings
    bool load();
    bool save();

    // Backup defaults
    std::string get_backup_root() const;
    void set_backup_root(const std::string& path);

    int get_default_retention() const;
    void set_default_retention(int count);

    int get_default_debounce_seconds() const;
    void set_default_debounce_seconds(int seconds);

    bool get_compress_backups() const;
    void set_compress_backups(bool enabled);

    int get_safety_retention() const;
    void set_safety_retention(int count);

    // Concurrency
    int get_manual_wait_seconds() const;
    int get_worker_threads() const;

    // Watch retry policy
    int get_watch_retry_limit() const;
    int get_watch_retry_base_ms() const;
    int get_watch_retry_max_ms() const;

    // Notifications / logging
    bool get_show_notifications() const;
    void set_show_notifications(bool enabled);

    bool get_debug_logging() const;
    void set_debug_logging(bool enabled);

    std::string get_log_file() const;

    // Settings change callback
    using SettingsChangeCallback = std::function<void(const std::string& key)>;
    void set_change_callback(SettingsChangeCallback callback);

    // Generic getters/setters for custom settings
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    // Directory holding settings.json and profiles.json
    std::string get_config_dir() const;
    const std::string& get_config_path() const { return config_path_; }

    static std::string default_config_dir();
    static std::string default_backup_root();
    static std::string default_log_file();

private:
    SettingsManager();

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    void notify_change(const std::string& key);
    void ensure_defaults();

    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string config_path_;
    SettingsChangeCallback change_callback_;
    bool loaded_ = false;
};

} // namespace savekeeper

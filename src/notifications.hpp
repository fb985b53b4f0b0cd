#pragma once

#include <string>
#include <mutex>
#include <cstdint>
#include <gio/gio.h>

namespace savekeeper {

enum class NotificationType {
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

/**
 * Desktop Notifications Manager
 *
 * Tells the user about:
 * - Backups that were created or failed
 * - Restores that completed (with the safety snapshot to undo them) or failed
 * - Watches that gave up after exhausting their retries
 *
 * Uses GNotification (GIO); only meaningful once init() has been given the
 * daemon's GApplication. Call from the GLib main thread.
 */
class NotificationManager {
public:
    static NotificationManager& getInstance();

    void init(GApplication* app);

    void notify(const std::string& title, const std::string& body,
                NotificationType type = NotificationType::INFO);

    void notify_backup_failed(const std::string& entity_name, const std::string& error);
    void notify_backup_created(const std::string& entity_name, const std::string& snapshot_id,
                               uint64_t size_bytes);
    void notify_restore_complete(const std::string& entity_name, const std::string& snapshot_id,
                                 const std::string& safety_snapshot_id);
    void notify_restore_failed(const std::string& entity_name, const std::string& error);
    void notify_watch_failure(const std::string& entity_name, const std::string& error);

    void set_enabled(bool enabled);
    bool is_enabled() const;

private:
    NotificationManager() = default;
    ~NotificationManager() = default;

    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    std::string get_icon_for_type(NotificationType type) const;

    mutable std::mutex mutex_;
    GApplication* app_ = nullptr;
    bool enabled_ = true;
};

} // namespace savekeeper

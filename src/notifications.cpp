#include "notifications.hpp"
#include "logger.hpp"
#include "fs_utils.hpp"
#include <chrono>

namespace savekeeper {

NotificationManager& NotificationManager::getInstance() {
    static NotificationManager instance;
    return instance;
}

void NotificationManager::init(GApplication* app) {
    std::lock_guard<std::mutex> lock(mutex_);
    app_ = app;
    if (app_) {
        Logger::info("[Notifications] Notification manager initialized");
    }
}

void NotificationManager::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

bool NotificationManager::is_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

std::string NotificationManager::get_icon_for_type(NotificationType type) const {
    switch (type) {
        case NotificationType::SUCCESS:
            return "emblem-ok-symbolic";
        case NotificationType::WARNING:
            return "dialog-warning-symbolic";
        case NotificationType::ERROR:
            return "dialog-error-symbolic";
        case NotificationType::INFO:
        default:
            return "document-save-symbolic";
    }
}

void NotificationManager::notify(const std::string& title, const std::string& body,
                                 NotificationType type) {
    GApplication* app = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_ || !app_) {
            Logger::debug("[Notifications] Skipped: " + title);
            return;
        }
        app = app_;
    }

    GNotification* notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, body.c_str());

    GIcon* icon = g_themed_icon_new(get_icon_for_type(type).c_str());
    g_notification_set_icon(notification, icon);

    switch (type) {
        case NotificationType::ERROR:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_URGENT);
            break;
        case NotificationType::WARNING:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_HIGH);
            break;
        default:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_NORMAL);
            break;
    }

    std::string notification_id = "savekeeper-" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());

    g_application_send_notification(app, notification_id.c_str(), notification);

    g_object_unref(icon);
    g_object_unref(notification);

    Logger::info("[Notifications] Sent: " + title);
}

void NotificationManager::notify_backup_failed(const std::string& entity_name,
                                               const std::string& error) {
    notify("Backup Failed", entity_name + ": " + error, NotificationType::ERROR);
}

void NotificationManager::notify_backup_created(const std::string& entity_name,
                                                const std::string& snapshot_id,
                                                uint64_t size_bytes) {
    std::string body = entity_name + " saved as " + snapshot_id +
                       " (" + fsutil::format_file_size(size_bytes) + ")";
    notify("Backup Created", body, NotificationType::SUCCESS);
}

void NotificationManager::notify_restore_complete(const std::string& entity_name,
                                                  const std::string& snapshot_id,
                                                  const std::string& safety_snapshot_id) {
    std::string body = entity_name + " restored to " + snapshot_id;
    if (!safety_snapshot_id.empty()) {
        body += ". Previous state kept as " + safety_snapshot_id;
    }
    notify("Restore Complete", body, NotificationType::SUCCESS);
}

void NotificationManager::notify_restore_failed(const std::string& entity_name,
                                                const std::string& error) {
    notify("Restore Failed", entity_name + ": " + error + ". Your saves were not changed.",
           NotificationType::ERROR);
}

void NotificationManager::notify_watch_failure(const std::string& entity_name,
                                               const std::string& error) {
    notify("Watching Stopped", entity_name + " is no longer watched: " + error,
           NotificationType::WARNING);
}

} // namespace savekeeper

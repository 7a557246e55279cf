#include "notifications.hpp"
#include "logger.hpp"

namespace projsync {

NotificationManager& NotificationManager::getInstance() {
    static NotificationManager instance;
    return instance;
}

void NotificationManager::init(GApplication* app) {
    app_ = app;
}

void NotificationManager::notify_full_sync(const std::string& project_name, const FullSyncReport& report) {
    std::string id = "full-sync-" + project_name;

    if (report.ok()) {
        send(id, "Full Sync Complete", project_name + " is in sync with the remote machine",
             "emblem-ok-symbolic", G_NOTIFICATION_PRIORITY_NORMAL);
        return;
    }
    if (report.result != StepResult::Failed) {
        return;
    }

    // Nothing was pushed yet when the first step fails
    GNotificationPriority priority = report.steps_completed == 0 ? G_NOTIFICATION_PRIORITY_HIGH
                                                                 : G_NOTIFICATION_PRIORITY_URGENT;
    std::string body = project_name + ": stopped at " + report.stopped_at + " after " +
                       std::to_string(report.steps_completed) + " of " +
                       std::to_string(report.steps_total) + " steps";
    send(id, "Full Sync Stopped", body, "dialog-warning-symbolic", priority);
}

void NotificationManager::send(const std::string& id, const std::string& title, const std::string& body,
                               const char* icon_name, GNotificationPriority priority) {
    if (!enabled_ || !app_) {
        Logger::debug("[Notifications] Not sent (disabled): " + title);
        return;
    }

    GNotification* notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, body.c_str());
    GIcon* icon = g_themed_icon_new(icon_name);
    g_notification_set_icon(notification, icon);
    g_notification_set_priority(notification, priority);

    g_application_send_notification(app_, id.c_str(), notification);

    g_object_unref(icon);
    g_object_unref(notification);
    Logger::debug("[Notifications] Sent '" + title + "' for " + id);
}

} // namespace projsync

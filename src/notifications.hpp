#pragma once

#include <string>
#include <gio/gio.h>
#include "full_sync.hpp"

namespace projsync {

/**
 * Desktop notifications for full sync results
 *
 * Uses GNotification so the outcome of a long full sync is seen even when
 * the window is in the background. One notification per project is kept;
 * a newer result replaces the older one.
 */
class NotificationManager {
public:
    static NotificationManager& getInstance();

    void init(GApplication* app);
    void set_enabled(bool enabled) { enabled_ = enabled; }

    // Cancelled runs are not announced
    void notify_full_sync(const std::string& project_name, const FullSyncReport& report);

private:
    NotificationManager() = default;

    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    void send(const std::string& id, const std::string& title, const std::string& body,
              const char* icon_name, GNotificationPriority priority);

    GApplication* app_ = nullptr;
    bool enabled_ = true;
};

} // namespace projsync

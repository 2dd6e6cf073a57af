#pragma once

#include "roon_mpris/platform/ui_service.hpp"
#include <QSystemTrayIcon>

namespace roon_mpris::platform::qt {

// Desktop notifications through QSystemTrayIcon::showMessage, which Qt
// routes to org.freedesktop.Notifications on Linux.
class QtNotificationManager : public NotificationManager {
public:
    // tray_icon is borrowed; a private icon is created when it is null
    explicit QtNotificationManager(QSystemTrayIcon* tray_icon = nullptr);
    ~QtNotificationManager() override;

    std::expected<void, UiError> initialize() override;
    void shutdown() override;
    bool is_supported() const override;

    std::expected<void, UiError> show_notification(const Notification& notification) override;

private:
    QSystemTrayIcon* m_tray_icon;
    bool m_owns_tray_icon;
    bool m_initialized = false;
    std::string m_component_name = "QtNotificationManager";
};

} // namespace roon_mpris::platform::qt

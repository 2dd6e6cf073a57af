#include "roon_mpris/platform/qt/qt_ui_service.hpp"
#include "roon_mpris/platform/qt/qt_notification_manager.hpp"
#include "roon_mpris/platform/qt/qt_system_tray.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <QCoreApplication>
#include <QSystemTrayIcon>

namespace roon_mpris::platform::qt {

QtUiService::~QtUiService() {
    shutdown();
}

std::expected<void, UiError> QtUiService::initialize() {
    if (m_initialized) {
        return {};
    }

    // main() owns the QApplication
    m_app = qobject_cast<QApplication*>(QCoreApplication::instance());
    if (!m_app) {
        LOG_ERROR(m_component_name, "QApplication not available");
        return std::unexpected(UiError::InitializationFailed);
    }

    m_initialized = true;
    LOG_DEBUG(m_component_name, "Qt UI service initialized");
    return {};
}

void QtUiService::shutdown() {
    if (!m_initialized) {
        return;
    }

    m_app = nullptr;
    m_initialized = false;
    LOG_DEBUG(m_component_name, "Qt UI service shut down");
}

bool QtUiService::supports_system_tray() const {
    return QSystemTrayIcon::isSystemTrayAvailable();
}

std::unique_ptr<SystemTray> QtUiService::create_system_tray() {
    if (!m_initialized) {
        LOG_ERROR(m_component_name, "UI service not initialized, cannot create system tray");
        return nullptr;
    }

    if (!supports_system_tray()) {
        LOG_WARNING(m_component_name, "No system tray on this desktop");
        return nullptr;
    }

    return std::make_unique<QtSystemTray>();
}

std::unique_ptr<NotificationManager> QtUiService::create_notification_manager(SystemTray* tray) {
    if (!m_initialized) {
        LOG_ERROR(m_component_name, "UI service not initialized, cannot create notification manager");
        return nullptr;
    }

    QSystemTrayIcon* icon = nullptr;
    if (auto* qt_tray = dynamic_cast<QtSystemTray*>(tray)) {
        icon = qt_tray->native_icon();
    }
    return std::make_unique<QtNotificationManager>(icon);
}

} // namespace roon_mpris::platform::qt

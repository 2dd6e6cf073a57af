#include "roon_mpris/platform/qt/qt_notification_manager.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <QApplication>
#include <QIcon>
#include <QPixmap>

namespace roon_mpris::platform::qt {

QtNotificationManager::QtNotificationManager(QSystemTrayIcon* tray_icon)
    : m_tray_icon(tray_icon), m_owns_tray_icon(false) {
    if (!m_tray_icon) {
        m_tray_icon = new QSystemTrayIcon();
        m_owns_tray_icon = true;
    }
}

QtNotificationManager::~QtNotificationManager() {
    shutdown();
    if (m_owns_tray_icon) {
        delete m_tray_icon;
    }
}

std::expected<void, UiError> QtNotificationManager::initialize() {
    if (m_initialized) {
        return {};
    }

    if (!QSystemTrayIcon::supportsMessages()) {
        LOG_WARNING(m_component_name, "Desktop does not support notifications");
        return std::unexpected(UiError::NotSupported);
    }

    if (m_owns_tray_icon) {
        m_tray_icon->setIcon(QApplication::windowIcon());
        m_tray_icon->show();
    }

    m_initialized = true;
    LOG_DEBUG(m_component_name, "Qt notification manager initialized");
    return {};
}

void QtNotificationManager::shutdown() {
    if (!m_initialized) {
        return;
    }

    if (m_owns_tray_icon) {
        m_tray_icon->hide();
    }
    m_initialized = false;
}

bool QtNotificationManager::is_supported() const {
    return QSystemTrayIcon::supportsMessages();
}

std::expected<void, UiError>
QtNotificationManager::show_notification(const Notification& notification) {
    if (!m_initialized) {
        return std::unexpected(UiError::NotSupported);
    }

    // Load the pixmap now: the artwork file is rewritten on the next track
    QIcon icon;
    if (!notification.icon_path.empty()) {
        QPixmap pixmap(QString::fromStdString(notification.icon_path));
        if (pixmap.isNull()) {
            LOG_WARNING(m_component_name, "Could not load notification icon " + notification.icon_path);
        } else {
            icon = QIcon(pixmap);
        }
    }

    m_tray_icon->showMessage(
        QString::fromStdString(notification.title),
        QString::fromStdString(notification.message),
        icon,
        static_cast<int>(notification.duration.count() * 1000)
    );

    LOG_DEBUG(m_component_name, "Notification shown: " + notification.title + " / " + notification.message);
    return {};
}

} // namespace roon_mpris::platform::qt

#include "roon_mpris/platform/qt/qt_system_tray.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <QAction>
#include <QApplication>
#include <QFile>
#include <QPixmap>

namespace roon_mpris::platform::qt {

namespace {
    constexpr const char* DEFAULT_THEME_ICON = "multimedia-player";
}

QtSystemTray::~QtSystemTray() {
    shutdown();
}

std::expected<void, UiError> QtSystemTray::initialize() {
    if (m_initialized) {
        return {};
    }

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        LOG_WARNING(m_component_name, "System tray is not available on this desktop");
        return std::unexpected(UiError::NotSupported);
    }

    m_tray_icon = std::make_unique<QSystemTrayIcon>();
    m_context_menu = std::make_unique<QMenu>();
    m_tray_icon->setContextMenu(m_context_menu.get());

    QIcon icon = load_icon(DEFAULT_THEME_ICON);
    m_tray_icon->setIcon(icon.isNull() ? QApplication::windowIcon() : icon);

    m_initialized = true;
    LOG_DEBUG(m_component_name, "Qt system tray initialized");
    return {};
}

void QtSystemTray::shutdown() {
    if (!m_initialized) {
        return;
    }

    // Drop signal connections before the actions go away
    for (auto& [id, action] : m_action_map) {
        QObject::disconnect(action, nullptr, nullptr, nullptr);
    }
    m_action_map.clear();

    if (m_tray_icon) {
        m_tray_icon->hide();
    }
    if (m_context_menu) {
        m_context_menu->clear();
    }

    m_context_menu.reset();
    m_tray_icon.reset();

    m_initialized = false;
    LOG_DEBUG(m_component_name, "Qt system tray shut down");
}

bool QtSystemTray::is_initialized() const {
    return m_initialized;
}

std::expected<void, UiError> QtSystemTray::set_tooltip(const std::string& tooltip) {
    if (!m_initialized) {
        return std::unexpected(UiError::NotSupported);
    }

    m_tray_icon->setToolTip(QString::fromStdString(tooltip));
    return {};
}

std::expected<void, UiError> QtSystemTray::set_menu(const std::vector<MenuItem>& items) {
    if (!m_initialized) {
        return std::unexpected(UiError::NotSupported);
    }

    m_context_menu->clear();
    m_action_map.clear();

    for (const auto& item : items) {
        if (item.type == MenuItemType::Separator) {
            m_context_menu->addSeparator();
            continue;
        }

        QAction* action = m_context_menu->addAction(QString::fromStdString(item.label));
        action->setEnabled(item.enabled);
        if (item.action) {
            QObject::connect(action, &QAction::triggered, item.action);
        }
        if (!item.id.empty()) {
            m_action_map[item.id] = action;
        }
    }

    LOG_DEBUG(m_component_name, "Menu updated with " + std::to_string(items.size()) + " items");
    return {};
}

std::expected<void, UiError> QtSystemTray::set_menu_item_label(const std::string& id, const std::string& label) {
    auto it = m_action_map.find(id);
    if (it == m_action_map.end()) {
        return std::unexpected(UiError::ResourceNotFound);
    }

    it->second->setText(QString::fromStdString(label));
    return {};
}

void QtSystemTray::show() {
    if (m_initialized) {
        m_tray_icon->show();
    }
}

void QtSystemTray::hide() {
    if (m_initialized) {
        m_tray_icon->hide();
    }
}

// Accepts a file path or a freedesktop icon theme name
QIcon QtSystemTray::load_icon(const std::string& name_or_path) const {
    const QString name = QString::fromStdString(name_or_path);
    if (QFile::exists(name)) {
        QPixmap pixmap(name);
        if (!pixmap.isNull()) {
            return QIcon(pixmap);
        }
    }
    return QIcon::fromTheme(name);
}

} // namespace roon_mpris::platform::qt

#pragma once

#include "roon_mpris/platform/ui_service.hpp"
#include <QIcon>
#include <QMenu>
#include <QSystemTrayIcon>
#include <map>
#include <memory>

class QAction;

namespace roon_mpris::platform::qt {

class QtSystemTray : public SystemTray {
public:
    QtSystemTray() = default;
    ~QtSystemTray() override;

    std::expected<void, UiError> initialize() override;
    void shutdown() override;
    bool is_initialized() const override;

    std::expected<void, UiError> set_tooltip(const std::string& tooltip) override;

    std::expected<void, UiError> set_menu(const std::vector<MenuItem>& items) override;
    std::expected<void, UiError> set_menu_item_label(const std::string& id, const std::string& label) override;

    void show() override;
    void hide() override;

    // Lets the notification manager post balloon messages from the same icon
    QSystemTrayIcon* native_icon() const { return m_tray_icon.get(); }

private:
    QIcon load_icon(const std::string& name_or_path) const;

    std::unique_ptr<QSystemTrayIcon> m_tray_icon;
    std::unique_ptr<QMenu> m_context_menu;
    std::map<std::string, QAction*> m_action_map;

    bool m_initialized = false;
    std::string m_component_name = "QtSystemTray";
};

} // namespace roon_mpris::platform::qt

#pragma once

#include "roon_mpris/platform/ui_service.hpp"
#include <QApplication>
#include <memory>

namespace roon_mpris::platform::qt {

class QtUiService : public UiService {
public:
    QtUiService() = default;
    ~QtUiService() override;

    std::expected<void, UiError> initialize() override;
    void shutdown() override;

    bool supports_system_tray() const override;
    std::unique_ptr<SystemTray> create_system_tray() override;
    std::unique_ptr<NotificationManager> create_notification_manager(SystemTray* tray) override;

private:
    QApplication* m_app = nullptr;
    bool m_initialized = false;
    std::string m_component_name = "QtUiService";
};

} // namespace roon_mpris::platform::qt

#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace roon_mpris {
namespace platform {

enum class UiError {
    NotSupported,
    InitializationFailed,
    ResourceNotFound,
    OperationFailed
};

std::string to_string(UiError error);

enum class MenuItemType {
    Action,
    Separator
};

struct MenuItem {
    MenuItemType type = MenuItemType::Action;
    std::string id;
    std::string label;
    bool enabled = true;
    std::function<void()> action;

    MenuItem() = default;
    MenuItem(std::string id, std::string label, std::function<void()> action = {});

    static MenuItem separator();
};

// A desktop notification. icon_path may be empty for a text-only message.
struct Notification {
    std::string title;
    std::string message;
    std::string icon_path;
    std::chrono::seconds duration{5};

    Notification() = default;
    Notification(std::string title, std::string message, std::string icon_path = {});
};

class NotificationManager {
public:
    virtual ~NotificationManager() = default;

    virtual std::expected<void, UiError> initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_supported() const = 0;

    // Fire-and-forget; must be called on the UI thread
    virtual std::expected<void, UiError> show_notification(const Notification& notification) = 0;
};

class SystemTray {
public:
    virtual ~SystemTray() = default;

    virtual std::expected<void, UiError> initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    virtual std::expected<void, UiError> set_tooltip(const std::string& tooltip) = 0;

    virtual std::expected<void, UiError> set_menu(const std::vector<MenuItem>& items) = 0;
    virtual std::expected<void, UiError> set_menu_item_label(const std::string& id, const std::string& label) = 0;

    virtual void show() = 0;
    virtual void hide() = 0;
};

// Factory for the desktop integration pieces
class UiService {
public:
    virtual ~UiService() = default;

    virtual std::expected<void, UiError> initialize() = 0;
    virtual void shutdown() = 0;

    virtual bool supports_system_tray() const = 0;
    virtual std::unique_ptr<SystemTray> create_system_tray() = 0;
    // Shares the tray's icon when one is given, otherwise owns a private one
    virtual std::unique_ptr<NotificationManager> create_notification_manager(SystemTray* tray) = 0;

    static std::unique_ptr<UiService> create_default();
};

} // namespace platform
} // namespace roon_mpris

#include "roon_mpris/platform/ui_service.hpp"
#include "roon_mpris/platform/qt/qt_ui_service.hpp"

namespace roon_mpris {
namespace platform {

std::string to_string(UiError error) {
    switch (error) {
        case UiError::NotSupported: return "not supported";
        case UiError::InitializationFailed: return "initialization failed";
        case UiError::ResourceNotFound: return "resource not found";
        case UiError::OperationFailed: return "operation failed";
    }
    return "unknown UI error";
}

MenuItem::MenuItem(std::string id, std::string label, std::function<void()> action)
    : type(MenuItemType::Action), id(std::move(id)), label(std::move(label)), action(std::move(action)) {}

MenuItem MenuItem::separator() {
    MenuItem item;
    item.type = MenuItemType::Separator;
    return item;
}

Notification::Notification(std::string title, std::string message, std::string icon_path)
    : title(std::move(title)), message(std::move(message)), icon_path(std::move(icon_path)) {}

std::unique_ptr<UiService> UiService::create_default() {
    return std::make_unique<qt::QtUiService>();
}

} // namespace platform
} // namespace roon_mpris

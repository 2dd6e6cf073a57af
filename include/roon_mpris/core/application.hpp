#pragma once

#include "roon_mpris/core/models.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace roon_mpris {
namespace core {

class EventBus;

// Command-line values that override config.yaml for this run only
struct ApplicationOptions {
    std::filesystem::path config_directory;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<bool> log_traffic;
    std::optional<utils::LogLevel> log_level;

    ApplicationConfig apply_to(ApplicationConfig config) const;
};

// Main application interface
class Application {
public:
    virtual ~Application() = default;

    // Lifecycle management
    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    virtual void stop() = 0;
    virtual void shutdown() = 0;

    // State management
    virtual ApplicationState get_state() const = 0;
    virtual bool is_running() const = 0;

    // Leaves the Qt event loop; main() then stops and shuts down
    virtual void quit() = 0;

    // Effective configuration, command-line overrides applied
    virtual std::expected<ApplicationConfig, ApplicationError> get_config() const = 0;

    // Event bus access
    virtual std::expected<std::reference_wrapper<EventBus>, ApplicationError> get_event_bus() = 0;
};

// Application creation
std::expected<std::unique_ptr<Application>, ApplicationError> create_application(ApplicationOptions options);

} // namespace core
} // namespace roon_mpris

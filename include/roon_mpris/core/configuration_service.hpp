#pragma once

#include "roon_mpris/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>

namespace roon_mpris::core {

class EventBus;

// Owns config.yaml: loads it (writing defaults on first run), validates
// updates, persists them and announces them on the event bus.
class ConfigurationService {
public:
    virtual ~ConfigurationService() = default;

    virtual std::expected<void, ConfigError> load() = 0;
    virtual std::expected<void, ConfigError> save() = 0;

    // Snapshot copy; the stored value may be replaced by update()
    virtual ApplicationConfig get() const = 0;
    virtual std::expected<void, ConfigError> update(const ApplicationConfig& config) = 0;

    virtual const std::filesystem::path& config_path() const = 0;
    virtual void set_event_bus(std::shared_ptr<EventBus> bus) = 0;

    static std::unique_ptr<ConfigurationService> create(
        const std::filesystem::path& config_dir = {},
        std::shared_ptr<EventBus> event_bus = nullptr);

    // $XDG_CONFIG_HOME/roon-mpris, falling back to ~/.config/roon-mpris
    static std::filesystem::path default_config_directory();
};

} // namespace roon_mpris::core

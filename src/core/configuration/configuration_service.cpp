#include "roon_mpris/core/configuration_service.hpp"
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/core/events.hpp"
#include "roon_mpris/utils/yaml_config.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace roon_mpris {
namespace core {

namespace {
    constexpr std::string_view CONFIG_FILE_NAME = "config.yaml";

    constexpr std::string_view DOCUMENTATION_HEADER =
        "# roon-mpris configuration\n"
        "# Written with defaults on first run. The zone is normally chosen from\n"
        "# Roon's extension settings; editing it here works too.\n"
        "#\n"
        "# log_level: debug, info, warning, error or none\n"
        "# zone: {name, output_id} of the Roon zone mirrored over MPRIS, or ~\n"
        "# roon.host / roon.port: connect directly; an empty host uses discovery\n"
        "# roon.log_level: all logs every protocol message, none disables it\n"
        "# mpris.bus_name: suffix of org.mpris.MediaPlayer2.<bus_name>\n"
        "# mpris.map_can_play: publish Roon's CanPlay flag (hides some docks)\n"
        "# notifications.artwork_path: scratch file for the current cover\n"
        "# notifications.require_artwork: skip notifications without cover art\n\n";
}

class ConfigurationServiceImpl : public ConfigurationService {
public:
    explicit ConfigurationServiceImpl(const std::filesystem::path& config_dir)
        : m_config_path((config_dir.empty() ? default_config_directory() : config_dir) / CONFIG_FILE_NAME) {
        LOG_DEBUG("ConfigService", "Using " + m_config_path.string());
        ensure_config_directory();
    }

    std::expected<void, ConfigError> load() override {
        if (!std::filesystem::exists(m_config_path)) {
            LOG_INFO("ConfigService", "No configuration yet, writing defaults");
            {
                std::unique_lock lock(m_mutex);
                m_config = ApplicationConfig{};
            }
            auto result = save();
            if (result) {
                add_documentation_header();
            }
            return result;
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return std::unexpected(result.error());
        }

        std::unique_lock lock(m_mutex);
        m_config = std::move(*result);
        LOG_INFO("ConfigService", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() override {
        ApplicationConfig config_copy = get();
        LOG_DEBUG("ConfigService", "Saving configuration");
        return utils::YamlConfigHelper::save_to_file(config_copy, m_config_path);
    }

    ApplicationConfig get() const override {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    std::expected<void, ConfigError> update(const ApplicationConfig& config) override {
        if (!config.is_valid()) {
            LOG_ERROR("ConfigService", "Rejected invalid configuration");
            return std::unexpected(ConfigError::ValidationError);
        }

        ApplicationConfig old_config;
        {
            std::unique_lock lock(m_mutex);
            old_config = m_config;
            m_config = config;
        }

        auto result = save();
        if (!result) {
            LOG_ERROR("ConfigService", "Failed to persist configuration: " + to_string(result.error()));
            return result;
        }

        LOG_INFO("ConfigService", "Configuration updated");
        if (m_event_bus) {
            m_event_bus->publish(events::ConfigurationUpdated{std::move(old_config), config});
        }
        return {};
    }

    const std::filesystem::path& config_path() const override {
        return m_config_path;
    }

    void set_event_bus(std::shared_ptr<EventBus> bus) override {
        m_event_bus = std::move(bus);
    }

private:
    void ensure_config_directory() {
        std::error_code ec;
        auto dir = m_config_path.parent_path();
        if (!std::filesystem::exists(dir, ec)) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                LOG_WARNING("ConfigService", "Cannot create " + dir.string() + ": " + ec.message());
            } else {
                LOG_DEBUG("ConfigService", "Created directory: " + dir.string());
            }
        }
    }

    // Prepend the comment block so a hand-edited file stays self-describing
    void add_documentation_header() const {
        std::ifstream in_file(m_config_path);
        if (!in_file) {
            return;
        }
        std::stringstream content;
        content << DOCUMENTATION_HEADER << in_file.rdbuf();
        in_file.close();

        std::ofstream out_file(m_config_path, std::ios::trunc);
        if (!out_file) {
            LOG_WARNING("ConfigService", "Could not document " + m_config_path.string());
            return;
        }
        out_file << content.str();
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
    std::shared_ptr<EventBus> m_event_bus;
};

std::filesystem::path ConfigurationService::default_config_directory() {
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        return std::filesystem::path(xdg_config) / "roon-mpris";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "roon-mpris";
    }
    return std::filesystem::current_path() / "roon-mpris";
}

std::unique_ptr<ConfigurationService> ConfigurationService::create(
    const std::filesystem::path& config_dir,
    std::shared_ptr<EventBus> event_bus) {
    auto service = std::make_unique<ConfigurationServiceImpl>(config_dir);
    if (event_bus) {
        service->set_event_bus(std::move(event_bus));
    }
    return service;
}

} // namespace core
} // namespace roon_mpris

#pragma once

#include "roon_mpris/core/configuration_service.hpp"
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/services/roon/moo_message.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace roon_mpris::services {

/**
 * @brief The com.roonlabs.settings:1 service this extension provides
 *
 * Exposes a single "zone" field in Roon's extension settings. Saved values go
 * through the ConfigurationService; every ConfigurationUpdated that changes
 * the zone is pushed to the core's open settings subscriptions.
 */
class SettingsProvider {
public:
    static constexpr std::string_view SERVICE_NAME = "com.roonlabs.settings:1";

    // Sends a response on the request (or subscription) being answered
    using Reply = std::function<void(MooVerb verb, const std::string& name, const nlohmann::json& body)>;

    SettingsProvider(core::ConfigurationService& config_service, core::EventBus& event_bus);
    ~SettingsProvider();

    SettingsProvider(const SettingsProvider&) = delete;
    SettingsProvider& operator=(const SettingsProvider&) = delete;

    // Returns false for a method this service does not know
    bool handle_request(const MooMessage& request, const Reply& reply);

    // Subscriptions belong to one socket; dropped when it closes
    void clear_subscriptions();
    std::size_t subscription_count() const { return m_subscriptions.size(); }

    /**
     * @brief Build the settings layout Roon renders for the given values
     *
     * The zone value must be null or an object with a non-empty name. Anything
     * else sets has_error and attaches an error to the zone field.
     */
    static nlohmann::json make_layout(const nlohmann::json& values);

    static nlohmann::json values_from_config(const core::ApplicationConfig& config);
    static std::optional<core::ZoneSelection> zone_from_values(const nlohmann::json& values);

private:
    void handle_save(const nlohmann::json& body, const Reply& reply);
    void publish_changed();

    core::ConfigurationService& m_config_service;
    core::EventBus& m_event_bus;
    core::EventBus::HandlerId m_config_handler = 0;
    std::map<std::string, Reply> m_subscriptions;
};

} // namespace roon_mpris::services

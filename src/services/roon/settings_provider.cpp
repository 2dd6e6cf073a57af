#include "roon_mpris/services/roon/settings_provider.hpp"
#include "roon_mpris/core/events.hpp"
#include "roon_mpris/utils/json_helper.hpp"
#include "roon_mpris/utils/logger.hpp"

namespace roon_mpris::services {

using utils::JsonHelper;

namespace {
    constexpr std::string_view COMPONENT = "SettingsProvider";

    std::string subscription_key(const nlohmann::json& body) {
        if (!body.is_object() || !body.contains("subscription_key")) {
            return {};
        }
        const auto& key = body.at("subscription_key");
        return key.is_string() ? key.get<std::string>() : key.dump();
    }
}

SettingsProvider::SettingsProvider(core::ConfigurationService& config_service, core::EventBus& event_bus)
    : m_config_service(config_service),
      m_event_bus(event_bus) {
    m_config_handler = m_event_bus.subscribe<core::events::ConfigurationUpdated>(
        [this](const core::events::ConfigurationUpdated& event) {
            if (event.zone_changed()) {
                publish_changed();
            }
        });
}

SettingsProvider::~SettingsProvider() {
    m_event_bus.unsubscribe(m_config_handler);
}

bool SettingsProvider::handle_request(const MooMessage& request, const Reply& reply) {
    auto body = request.json_body();
    if (!body) {
        LOG_WARNING(COMPONENT, "Bad settings request body: " + body.error());
        reply(MooVerb::Complete, "InvalidRequest", {{"error", body.error()}});
        return true;
    }

    const std::string method = request.method();
    if (method == "subscribe_settings") {
        auto key = subscription_key(*body);
        m_subscriptions[key] = reply;
        LOG_DEBUG(COMPONENT, "Settings subscription " + key + " opened");
        reply(MooVerb::Continue, "Subscribed",
              {{"settings", make_layout(values_from_config(m_config_service.get()))}});
    } else if (method == "unsubscribe_settings") {
        auto key = subscription_key(*body);
        m_subscriptions.erase(key);
        LOG_DEBUG(COMPONENT, "Settings subscription " + key + " closed");
        reply(MooVerb::Complete, "Unsubscribed", nlohmann::json::object());
    } else if (method == "get_settings") {
        reply(MooVerb::Complete, "Success",
              {{"settings", make_layout(values_from_config(m_config_service.get()))}});
    } else if (method == "save_settings") {
        handle_save(*body, reply);
    } else {
        return false;
    }
    return true;
}

void SettingsProvider::handle_save(const nlohmann::json& body, const Reply& reply) {
    bool is_dry_run = JsonHelper::get_optional<bool>(body, "is_dry_run", false);

    nlohmann::json values = nlohmann::json::object();
    if (JsonHelper::has_field(body, "settings") && body.at("settings").is_object()) {
        values = body.at("settings").value("values", nlohmann::json::object());
    }

    auto layout = make_layout(values);
    bool has_error = layout.at("has_error").get<bool>();
    reply(MooVerb::Complete, has_error ? "NotValid" : "Success", {{"settings", layout}});

    if (is_dry_run || has_error) {
        LOG_DEBUG(COMPONENT, std::string("Settings not saved (") + (has_error ? "invalid" : "dry run") + ")");
        return;
    }

    auto config = m_config_service.get();
    config.zone = zone_from_values(values);
    if (auto result = m_config_service.update(config); !result) {
        LOG_ERROR(COMPONENT, "Failed to save settings: " + core::to_string(result.error()));
        return;
    }
    LOG_INFO(COMPONENT, "Zone set to " + (config.zone ? "'" + config.zone->name + "'" : std::string("none")));
}

void SettingsProvider::clear_subscriptions() {
    m_subscriptions.clear();
}

void SettingsProvider::publish_changed() {
    if (m_subscriptions.empty()) {
        return;
    }

    nlohmann::json body = {{"settings", make_layout(values_from_config(m_config_service.get()))}};
    for (const auto& [key, reply] : m_subscriptions) {
        reply(MooVerb::Continue, "Changed", body);
    }
}

nlohmann::json SettingsProvider::make_layout(const nlohmann::json& values) {
    nlohmann::json zone_field = {
        {"type", "zone"},
        {"title", "Zone"},
        {"setting", "zone"}
    };

    bool has_error = false;
    nlohmann::json zone = values.is_object() ? values.value("zone", nlohmann::json()) : nlohmann::json();
    if (!zone.is_null()) {
        auto name = zone.is_object() ? JsonHelper::get_if_present<std::string>(zone, "name") : std::nullopt;
        if (!name || name->empty()) {
            has_error = true;
            zone_field["error"] = "Select a zone";
        }
    }

    return {
        {"values", values.is_object() ? values : nlohmann::json::object()},
        {"layout", nlohmann::json::array({zone_field})},
        {"has_error", has_error}
    };
}

nlohmann::json SettingsProvider::values_from_config(const core::ApplicationConfig& config) {
    nlohmann::json values = {{"zone", nullptr}};
    if (config.zone) {
        values["zone"] = {
            {"output_id", config.zone->output_id},
            {"name", config.zone->name}
        };
    }
    return values;
}

std::optional<core::ZoneSelection> SettingsProvider::zone_from_values(const nlohmann::json& values) {
    if (!values.is_object() || !JsonHelper::has_field(values, "zone") || !values.at("zone").is_object()) {
        return std::nullopt;
    }

    const auto& zone = values.at("zone");
    core::ZoneSelection selection;
    selection.name = JsonHelper::get_optional<std::string>(zone, "name", "");
    selection.output_id = JsonHelper::get_optional<std::string>(zone, "output_id", "");
    if (selection.name.empty()) {
        return std::nullopt;
    }
    return selection;
}

} // namespace roon_mpris::services

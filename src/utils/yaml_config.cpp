#include "roon_mpris/utils/yaml_config.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <fstream>

namespace roon_mpris {
namespace utils {

namespace {
    template<typename T>
    T read_or(const YAML::Node& node, const char* key, const T& fallback) {
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) {
            return fallback;
        }
        try {
            return value.as<T>();
        } catch (const YAML::Exception&) {
            LOG_WARNING("YamlConfig", std::string("Ignoring invalid value for '") + key + "'");
            return fallback;
        }
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlConfig", "Parse error in " + path.string() + ": " + e.what());
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path) {
    std::error_code ec;
    auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("YamlConfig", "Cannot create " + dir.string() + ": " + ec.message());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }
    }

    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
        return std::unexpected(core::ConfigError::PermissionDenied);
    }

    YAML::Emitter out;
    out << to_yaml(config);
    file << out.c_str() << '\n';
    if (!file) {
        return std::unexpected(core::ConfigError::PermissionDenied);
    }
    return {};
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;
    if (!node.IsMap()) {
        return config;
    }

    config.log_level = log_level_from_string(
        read_or<std::string>(node, "log_level", to_string(config.log_level)));
    config.zone = parse_zone(node["zone"]);
    config.roon = parse_roon_config(node["roon"]);
    config.mpris = parse_mpris_config(node["mpris"]);
    config.notifications = parse_notification_config(node["notifications"]);

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);

    if (config.zone) {
        node["zone"]["name"] = config.zone->name;
        node["zone"]["output_id"] = config.zone->output_id;
    } else {
        node["zone"] = YAML::Node(YAML::NodeType::Null);
    }

    node["roon"]["host"] = config.roon.host;
    node["roon"]["port"] = config.roon.port;
    node["roon"]["log_level"] = config.roon.log_traffic ? "all" : "none";

    node["mpris"]["bus_name"] = config.mpris.bus_name;
    node["mpris"]["identity"] = config.mpris.identity;
    node["mpris"]["map_can_play"] = config.mpris.map_can_play;

    node["notifications"]["enabled"] = config.notifications.enabled;
    node["notifications"]["artwork_path"] = config.notifications.artwork_path;
    node["notifications"]["require_artwork"] = config.notifications.require_artwork;

    return node;
}

std::optional<core::ZoneSelection> YamlConfigHelper::parse_zone(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return std::nullopt;
    }

    core::ZoneSelection zone;
    zone.name = read_or<std::string>(node, "name", "");
    zone.output_id = read_or<std::string>(node, "output_id", "");
    if (zone.name.empty()) {
        return std::nullopt;
    }
    return zone;
}

core::RoonConfig YamlConfigHelper::parse_roon_config(const YAML::Node& node) {
    core::RoonConfig config;
    if (!node || !node.IsMap()) {
        return config;
    }

    config.host = read_or(node, "host", config.host);
    const int port = read_or(node, "port", config.port);
    if (port >= 1 && port <= 65535) {
        config.port = port;
    } else {
        LOG_WARNING("YamlConfig", "Port out of range, using " + std::to_string(config.port));
    }
    config.log_traffic = read_or<std::string>(node, "log_level", "none") == "all";
    return config;
}

core::MprisConfig YamlConfigHelper::parse_mpris_config(const YAML::Node& node) {
    core::MprisConfig config;
    if (!node || !node.IsMap()) {
        return config;
    }

    const auto bus_name = read_or(node, "bus_name", config.bus_name);
    if (!bus_name.empty()) {
        config.bus_name = bus_name;
    }
    const auto identity = read_or(node, "identity", config.identity);
    if (!identity.empty()) {
        config.identity = identity;
    }
    config.map_can_play = read_or(node, "map_can_play", config.map_can_play);
    return config;
}

core::NotificationConfig YamlConfigHelper::parse_notification_config(const YAML::Node& node) {
    core::NotificationConfig config;
    if (!node || !node.IsMap()) {
        return config;
    }

    config.enabled = read_or(node, "enabled", config.enabled);
    const auto artwork_path = read_or(node, "artwork_path", config.artwork_path);
    if (!artwork_path.empty()) {
        config.artwork_path = artwork_path;
    }
    config.require_artwork = read_or(node, "require_artwork", config.require_artwork);
    return config;
}

} // namespace utils
} // namespace roon_mpris

#pragma once

#include "roon_mpris/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace roon_mpris {
namespace utils {

class YamlConfigHelper {
public:
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path);

    // Missing or mistyped values keep their defaults
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

private:
    static std::optional<core::ZoneSelection> parse_zone(const YAML::Node& node);
    static core::RoonConfig parse_roon_config(const YAML::Node& node);
    static core::MprisConfig parse_mpris_config(const YAML::Node& node);
    static core::NotificationConfig parse_notification_config(const YAML::Node& node);
};

} // namespace utils
} // namespace roon_mpris

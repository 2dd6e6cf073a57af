#pragma once

#include "roon_mpris/core/models.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace roon_mpris::core::events {

struct Event {
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
    Event() = default;
    virtual ~Event() = default;
};

struct ConfigurationUpdated : Event {
    ApplicationConfig previous_config;
    ApplicationConfig new_config;

    ConfigurationUpdated(ApplicationConfig prev, ApplicationConfig curr)
        : previous_config(std::move(prev)), new_config(std::move(curr)) {}

    bool zone_changed() const { return previous_config.zone != new_config.zone; }
};

struct CorePaired : Event {
    Connection connection;

    explicit CorePaired(Connection conn) : connection(std::move(conn)) {}
};

struct CoreUnpaired : Event {
    Connection connection;

    explicit CoreUnpaired(Connection conn) : connection(std::move(conn)) {}
};

// Published whenever the tracked zone's player state is reapplied
struct NowPlayingChanged : Event {
    std::string zone_name;
    std::string playback_status;
    std::optional<TrackMetadata> metadata;

    NowPlayingChanged(std::string zone, std::string status, std::optional<TrackMetadata> meta)
        : zone_name(std::move(zone)), playback_status(std::move(status)), metadata(std::move(meta)) {}
};

} // namespace roon_mpris::core::events

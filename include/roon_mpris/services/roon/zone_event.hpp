#pragma once

#include "roon_mpris/core/models.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace roon_mpris::services {

// "zones" (subscription start) or "zones_changed"
struct ZonesListing {
    enum class Kind { Initial, Changed };

    Kind kind = Kind::Initial;
    std::vector<core::ZoneSnapshot> zones;
};

struct SeekChange {
    std::string zone_id;
    std::optional<double> seek_position;  // seconds; absent while nothing is loaded
    std::optional<double> queue_time_remaining;
};

struct SeekChanges {
    std::vector<SeekChange> changes;
};

// Anything else the subscription delivers (zones_added, zones_removed, ...)
struct OtherEvent {
    std::string response;
    nlohmann::json body;
};

using ZoneEvent = std::variant<ZonesListing, SeekChanges, OtherEvent>;

// Decodes one subscribe_zones response. A message carrying several sections
// yields one event per recognised section, listings before seeks. Zone entries
// that fail to decode are logged and skipped.
std::vector<ZoneEvent> decode_zone_events(const std::string& response, const nlohmann::json& body);

std::expected<core::ZoneSnapshot, core::TranslateError> decode_zone(const nlohmann::json& zone);

} // namespace roon_mpris::services

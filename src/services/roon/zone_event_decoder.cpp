#include "roon_mpris/services/roon/zone_event.hpp"
#include "roon_mpris/utils/json_helper.hpp"
#include "roon_mpris/utils/logger.hpp"

namespace roon_mpris::services {

using utils::JsonHelper;

namespace {

core::NowPlaying decode_now_playing(const nlohmann::json& json) {
    core::NowPlaying now_playing;
    now_playing.length = JsonHelper::get_if_present<double>(json, "length");
    now_playing.image_key = JsonHelper::get_if_present<std::string>(json, "image_key");
    now_playing.seek_position = JsonHelper::get_if_present<double>(json, "seek_position");

    if (JsonHelper::has_field(json, "three_line")) {
        const auto& three_line = json.at("three_line");
        now_playing.three_line.line1 = JsonHelper::get_optional<std::string>(three_line, "line1", "");
        now_playing.three_line.line2 = JsonHelper::get_optional<std::string>(three_line, "line2", "");
        now_playing.three_line.line3 = JsonHelper::get_optional<std::string>(three_line, "line3", "");
    }
    return now_playing;
}

std::vector<core::ZoneSnapshot> decode_zone_list(const nlohmann::json& body, const std::string& field) {
    std::vector<core::ZoneSnapshot> zones;
    JsonHelper::for_each_in_array(body, field, [&zones](const nlohmann::json& entry) {
        auto zone = decode_zone(entry);
        if (zone) {
            zones.push_back(std::move(*zone));
            return;
        }

        std::string state = entry.is_object() ? JsonHelper::get_optional<std::string>(entry, "state", "") : "";
        LOG_ERROR("ZoneDecoder", "Skipping zone " +
                  (entry.is_object() ? JsonHelper::get_optional<std::string>(entry, "display_name", "?") : "?") +
                  ": " + core::to_string(zone.error()) + (state.empty() ? "" : " '" + state + "'"));
    });
    return zones;
}

} // namespace

std::expected<core::ZoneSnapshot, core::TranslateError> decode_zone(const nlohmann::json& zone) {
    if (!zone.is_object()) {
        return std::unexpected(core::TranslateError::MissingField);
    }

    auto zone_id = JsonHelper::get_if_present<std::string>(zone, "zone_id");
    auto display_name = JsonHelper::get_if_present<std::string>(zone, "display_name");
    auto state_name = JsonHelper::get_if_present<std::string>(zone, "state");
    if (!zone_id || !display_name || !state_name) {
        return std::unexpected(core::TranslateError::MissingField);
    }

    auto state = core::playback_state_from_string(*state_name);
    if (!state) {
        return std::unexpected(core::TranslateError::UnknownPlaybackState);
    }

    core::ZoneSnapshot snapshot;
    snapshot.zone_id = std::move(*zone_id);
    snapshot.display_name = std::move(*display_name);
    snapshot.state = *state;
    snapshot.is_next_allowed = JsonHelper::get_optional(zone, "is_next_allowed", false);
    snapshot.is_previous_allowed = JsonHelper::get_optional(zone, "is_previous_allowed", false);
    snapshot.is_pause_allowed = JsonHelper::get_optional(zone, "is_pause_allowed", false);
    snapshot.is_play_allowed = JsonHelper::get_optional(zone, "is_play_allowed", false);
    snapshot.is_seek_allowed = JsonHelper::get_optional(zone, "is_seek_allowed", false);
    if (JsonHelper::has_field(zone, "now_playing") && zone.at("now_playing").is_object()) {
        snapshot.now_playing = decode_now_playing(zone.at("now_playing"));
    }
    return snapshot;
}

std::vector<ZoneEvent> decode_zone_events(const std::string& response, const nlohmann::json& body) {
    std::vector<ZoneEvent> events;

    if (JsonHelper::has_field(body, "zones")) {
        events.emplace_back(ZonesListing{ZonesListing::Kind::Initial, decode_zone_list(body, "zones")});
    }
    if (JsonHelper::has_field(body, "zones_changed")) {
        events.emplace_back(ZonesListing{ZonesListing::Kind::Changed, decode_zone_list(body, "zones_changed")});
    }

    if (JsonHelper::has_field(body, "zones_seek_changed")) {
        SeekChanges seeks;
        JsonHelper::for_each_in_array(body, "zones_seek_changed", [&seeks](const nlohmann::json& entry) {
            auto zone_id = JsonHelper::get_if_present<std::string>(entry, "zone_id");
            if (!zone_id) {
                LOG_WARNING("ZoneDecoder", "Seek change without zone_id");
                return;
            }
            seeks.changes.push_back(SeekChange{
                std::move(*zone_id),
                JsonHelper::get_if_present<double>(entry, "seek_position"),
                JsonHelper::get_if_present<double>(entry, "queue_time_remaining")});
        });
        events.emplace_back(std::move(seeks));
    }

    if (events.empty()) {
        events.emplace_back(OtherEvent{response, body});
    }
    return events;
}

} // namespace roon_mpris::services

#include "roon_mpris/services/bridge/session_orchestrator.hpp"
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/core/events.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <type_traits>
#include <variant>

namespace roon_mpris::services {

namespace {
    constexpr std::string_view COMPONENT = "Orchestrator";
}

SessionOrchestrator::SessionOrchestrator(TransportClient& transport,
                                         platform::MediaPlayer& player,
                                         core::ZoneSelectionProvider selection,
                                         NotificationHandler notify,
                                         ZoneTranslator translator)
    : m_transport(transport),
      m_player(player),
      m_selection(std::move(selection)),
      m_notify(std::move(notify)),
      m_translator(std::move(translator)) {
    m_player.set_position_provider([this]() { return current_position_us(); });
}

void SessionOrchestrator::on_core_paired(const core::Connection& connection) {
    LOG_INFO(COMPONENT, "Paired with core " + connection.display_name + " (" +
             connection.display_version + ") at " + connection.base_address);
    m_state.connection = connection;
    m_state.zone.reset();
    subscribe();
}

void SessionOrchestrator::on_core_unpaired(const core::Connection& connection) {
    LOG_INFO(COMPONENT, "Core unpaired: " + connection.display_name);
    m_state.clear();
}

void SessionOrchestrator::on_selection_changed() {
    m_state.zone.reset();
    if (m_state.is_paired()) {
        LOG_DEBUG(COMPONENT, "Zone selection changed, resubscribing");
        subscribe();
    }
}

void SessionOrchestrator::subscribe() {
    m_transport.subscribe_zones([this](const ZoneEvent& event) {
        handle_zone_event(event);
    });
}

void SessionOrchestrator::handle_zone_event(const ZoneEvent& event) {
    if (!m_state.is_paired()) {
        LOG_DEBUG(COMPONENT, "Ignoring zone event while unpaired");
        return;
    }

    std::visit([this](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, ZonesListing>) {
            handle_listing(payload);
        } else if constexpr (std::is_same_v<T, SeekChanges>) {
            handle_seeks(payload);
        } else {
            LOG_DEBUG(COMPONENT, "Unhandled zone event " + payload.response + ": " + payload.body.dump());
        }
    }, event);
}

void SessionOrchestrator::handle_listing(const ZonesListing& listing) {
    std::optional<core::ZoneSelection> selection;
    if (m_selection) {
        selection = m_selection();
    }
    if (!selection) {
        LOG_DEBUG(COMPONENT, "No zone configured, ignoring " +
                  std::to_string(listing.zones.size()) + " zone(s)");
        return;
    }

    for (const auto& zone : listing.zones) {
        if (zone.display_name != selection->name) {
            continue;
        }
        apply_zone(zone);
    }
}

void SessionOrchestrator::handle_seeks(const SeekChanges& seeks) {
    if (!m_state.zone) {
        return;
    }

    for (const auto& change : seeks.changes) {
        if (change.zone_id != m_state.zone->zone_id) {
            continue;
        }
        if (m_state.zone->now_playing) {
            m_state.zone->now_playing->seek_position = change.seek_position;
        }
        m_player.set_position(ZoneTranslator::seconds_to_microseconds(change.seek_position.value_or(0.0)));
    }
}

void SessionOrchestrator::apply_zone(const core::ZoneSnapshot& zone) {
    auto translation = m_translator.translate(zone, *m_state.connection);
    m_state.zone = zone;

    LOG_DEBUG(COMPONENT, "Zone " + zone.display_name + " is " + translation.state.playback_status);
    apply_player_state(translation.state);
    m_player.set_position(current_position_us());

    if (m_event_bus) {
        m_event_bus->publish(core::events::NowPlayingChanged{
            zone.display_name, translation.state.playback_status, translation.state.metadata});
    }

    if (translation.notification && m_notify) {
        m_notify(*translation.notification);
    }
}

void SessionOrchestrator::apply_player_state(const core::PlayerState& state) {
    if (state.metadata) {
        m_player.set_metadata(*state.metadata);
    }
    m_player.set_playback_status(state.playback_status);
    m_player.set_can_go_next(state.can_go_next);
    m_player.set_can_go_previous(state.can_go_previous);
    m_player.set_can_pause(state.can_pause);
    m_player.set_can_seek(state.can_seek);
    if (state.can_play) {
        m_player.set_can_play(*state.can_play);
    }
}

std::int64_t SessionOrchestrator::current_position_us() const {
    if (!m_state.zone || !m_state.zone->now_playing || !m_state.zone->now_playing->seek_position) {
        return 0;
    }
    return ZoneTranslator::seconds_to_microseconds(*m_state.zone->now_playing->seek_position);
}

} // namespace roon_mpris::services

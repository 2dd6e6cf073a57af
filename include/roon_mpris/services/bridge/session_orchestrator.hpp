#pragma once

#include "roon_mpris/core/bridge_state.hpp"
#include "roon_mpris/platform/media_player.hpp"
#include "roon_mpris/services/bridge/zone_translator.hpp"
#include "roon_mpris/services/roon/transport_client.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace roon_mpris::core {
class EventBus;
}

namespace roon_mpris::services {

/**
 * @brief Keeps the MPRIS surface in step with the configured Roon zone
 *
 * Unpaired until the transport reports a paired core. While paired, zone
 * listings for the configured zone name are translated and applied, and
 * seek updates for the tracked zone id move the reported position.
 */
class SessionOrchestrator {
public:
    using NotificationHandler = std::function<void(const core::NotificationRequest&)>;

    SessionOrchestrator(TransportClient& transport,
                        platform::MediaPlayer& player,
                        core::ZoneSelectionProvider selection,
                        NotificationHandler notify,
                        ZoneTranslator translator = ZoneTranslator{});

    void on_core_paired(const core::Connection& connection);
    void on_core_unpaired(const core::Connection& connection);

    void handle_zone_event(const ZoneEvent& event);

    // The configured zone changed: forget the tracked zone and replay the listing
    void on_selection_changed();

    // Position for the surface's getter, in microseconds
    std::int64_t current_position_us() const;

    const core::BridgeState& state() const { return m_state; }

    void set_translator_options(TranslatorOptions options) { m_translator.set_options(options); }
    void set_event_bus(std::shared_ptr<core::EventBus> bus) { m_event_bus = std::move(bus); }

private:
    void subscribe();
    void handle_listing(const ZonesListing& listing);
    void handle_seeks(const SeekChanges& seeks);
    void apply_zone(const core::ZoneSnapshot& zone);
    void apply_player_state(const core::PlayerState& state);

    TransportClient& m_transport;
    platform::MediaPlayer& m_player;
    core::ZoneSelectionProvider m_selection;
    NotificationHandler m_notify;
    ZoneTranslator m_translator;
    core::BridgeState m_state;
    std::shared_ptr<core::EventBus> m_event_bus;
};

} // namespace roon_mpris::services

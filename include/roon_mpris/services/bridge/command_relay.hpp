#pragma once

#include "roon_mpris/core/bridge_state.hpp"
#include "roon_mpris/platform/media_player.hpp"
#include "roon_mpris/services/roon/transport_client.hpp"
#include <functional>
#include <optional>
#include <string>

namespace roon_mpris::services {

// Turns desktop media commands into Roon transport control calls
class CommandRelay {
public:
    using QuitHandler = std::function<void()>;

    CommandRelay(TransportClient& transport,
                 const core::BridgeState& state,
                 core::ZoneSelectionProvider selection,
                 QuitHandler quit);

    void dispatch(platform::PlayerCommand command);

    // Only Quit does anything; the rest have no Roon mapping and are logged
    void handle_event(platform::PlayerEvent event, const std::string& detail);

    // Selected output id when known, otherwise the tracked zone id
    std::optional<std::string> target_zone() const;

private:
    TransportClient& m_transport;
    const core::BridgeState& m_state;
    core::ZoneSelectionProvider m_selection;
    QuitHandler m_quit;
};

} // namespace roon_mpris::services

#include "roon_mpris/services/bridge/command_relay.hpp"
#include "roon_mpris/utils/logger.hpp"

namespace roon_mpris::services {

CommandRelay::CommandRelay(TransportClient& transport,
                           const core::BridgeState& state,
                           core::ZoneSelectionProvider selection,
                           QuitHandler quit)
    : m_transport(transport),
      m_state(state),
      m_selection(std::move(selection)),
      m_quit(std::move(quit)) {}

void CommandRelay::dispatch(platform::PlayerCommand command) {
    const std::string name(platform::to_string(command));

    if (!m_state.is_paired()) {
        LOG_WARNING("CommandRelay", "Dropping " + name + ": no paired core");
        return;
    }

    auto zone = target_zone();
    if (!zone) {
        LOG_WARNING("CommandRelay", "Dropping " + name + ": no zone selected");
        return;
    }

    LOG_DEBUG("CommandRelay", name + " -> " + *zone);
    m_transport.control(*zone, name);
}

void CommandRelay::handle_event(platform::PlayerEvent event, const std::string& detail) {
    const std::string name(platform::to_string(event));
    LOG_INFO("CommandRelay", "MPRIS " + name + (detail.empty() ? "" : " " + detail));

    if (event == platform::PlayerEvent::Quit && m_quit) {
        m_quit();
    }
}

std::optional<std::string> CommandRelay::target_zone() const {
    if (m_selection) {
        auto selection = m_selection();
        if (selection && !selection->output_id.empty()) {
            return selection->output_id;
        }
    }
    if (m_state.zone) {
        return m_state.zone->zone_id;
    }
    return std::nullopt;
}

} // namespace roon_mpris::services

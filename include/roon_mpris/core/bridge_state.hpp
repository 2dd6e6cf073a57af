#pragma once

#include "roon_mpris/core/models.hpp"
#include <functional>
#include <optional>

namespace roon_mpris::core {

// What the bridge currently knows: the paired core and the tracked zone.
// Owned by the SessionOrchestrator; never persisted.
struct BridgeState {
    std::optional<Connection> connection;
    std::optional<ZoneSnapshot> zone;

    bool is_paired() const { return connection.has_value(); }

    void clear() {
        connection.reset();
        zone.reset();
    }
};

// Reads the configured zone at the moment of use
using ZoneSelectionProvider = std::function<std::optional<ZoneSelection>()>;

} // namespace roon_mpris::core

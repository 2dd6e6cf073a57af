#pragma once

#include "roon_mpris/core/models.hpp"
#include "roon_mpris/services/roon/zone_event.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace roon_mpris::services {

// The bridge's view of a Roon core: pairing notifications, the zone event
// stream and transport control.
class TransportClient {
public:
    using PairingCallback = std::function<void(const core::Connection&)>;
    using ZoneEventCallback = std::function<void(const ZoneEvent&)>;

    virtual ~TransportClient() = default;

    virtual void set_paired_callback(PairingCallback callback) = 0;
    virtual void set_unpaired_callback(PairingCallback callback) = 0;

    // Starts (or restarts) the zone subscription on the paired core. A
    // restart replaces the previous subscription and replays the full listing.
    virtual void subscribe_zones(ZoneEventCallback callback) = 0;

    // Fire-and-forget; failures are logged by the client
    virtual void control(const std::string& zone_or_output_id, std::string_view command) = 0;
};

} // namespace roon_mpris::services

#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/utils/logger.hpp"

namespace roon_mpris::core {

void EventBus::handle_exception(const std::string& event_type, const std::exception& e) {
    LOG_ERROR("EventBus", "Handler for " + event_type + " threw: " + e.what());
}

}

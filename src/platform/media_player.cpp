#include "roon_mpris/platform/media_player.hpp"

namespace roon_mpris {
namespace platform {

// These double as the Roon transport control names
std::string_view to_string(PlayerCommand command) {
    switch (command) {
        case PlayerCommand::PlayPause: return "playpause";
        case PlayerCommand::Stop: return "stop";
        case PlayerCommand::Next: return "next";
        case PlayerCommand::Previous: return "previous";
    }
    return "unknown";
}

std::string_view to_string(PlayerEvent event) {
    switch (event) {
        case PlayerEvent::Raise: return "raise";
        case PlayerEvent::Quit: return "quit";
        case PlayerEvent::Pause: return "pause";
        case PlayerEvent::Play: return "play";
        case PlayerEvent::Seek: return "seek";
        case PlayerEvent::SetPosition: return "position";
        case PlayerEvent::OpenUri: return "open";
        case PlayerEvent::Volume: return "volume";
        case PlayerEvent::LoopStatus: return "loopStatus";
        case PlayerEvent::Shuffle: return "shuffle";
    }
    return "unknown";
}

} // namespace platform
} // namespace roon_mpris

#pragma once

#include "roon_mpris/core/models.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace roon_mpris {
namespace platform {

// Transport commands that have a Roon equivalent
enum class PlayerCommand {
    PlayPause,
    Stop,
    Next,
    Previous
};

// Everything else a desktop media controller can ask for
enum class PlayerEvent {
    Raise,
    Quit,
    Pause,
    Play,
    Seek,
    SetPosition,
    OpenUri,
    Volume,
    LoopStatus,
    Shuffle
};

std::string_view to_string(PlayerCommand command);
std::string_view to_string(PlayerEvent event);

// The desktop-facing media player (MPRIS on Linux). Setters only announce
// a change when the value actually differs.
class MediaPlayer {
public:
    using CommandCallback = std::function<void(PlayerCommand)>;
    using EventCallback = std::function<void(PlayerEvent, const std::string& detail)>;
    using PositionProvider = std::function<std::int64_t()>;

    virtual ~MediaPlayer() = default;

    virtual void set_metadata(const core::TrackMetadata& metadata) = 0;
    virtual void set_playback_status(const std::string& status) = 0;
    virtual void set_can_go_next(bool value) = 0;
    virtual void set_can_go_previous(bool value) = 0;
    virtual void set_can_pause(bool value) = 0;
    virtual void set_can_seek(bool value) = 0;
    virtual void set_can_play(bool value) = 0;

    // Microseconds. Not announced as a property change; clients poll it.
    virtual void set_position(std::int64_t position_us) = 0;

    virtual void set_command_callback(CommandCallback callback) = 0;
    virtual void set_event_callback(EventCallback callback) = 0;
    virtual void set_position_provider(PositionProvider provider) = 0;
};

} // namespace platform
} // namespace roon_mpris

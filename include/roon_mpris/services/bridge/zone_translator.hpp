#pragma once

#include "roon_mpris/core/models.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roon_mpris::services {

struct TranslatorOptions {
    // Publish Roon's is_play_allowed as CanPlay. Off by default: the Ubuntu
    // dock hides the whole player when CanPlay is false while playing.
    bool map_can_play = false;
};

struct Translation {
    core::PlayerState state;
    std::optional<core::NotificationRequest> notification;
};

// Pure mapping from a Roon zone to what the MPRIS surface shows
class ZoneTranslator {
public:
    explicit ZoneTranslator(TranslatorOptions options = {});

    Translation translate(const core::ZoneSnapshot& snapshot, const core::Connection& connection) const;

    void set_options(TranslatorOptions options) { m_options = options; }
    const TranslatorOptions& options() const { return m_options; }

    // Clamped to [0, INT64_MAX]; NaN maps to 0
    static std::int64_t seconds_to_microseconds(double seconds);

    // "A / B / C" -> {"A", "B", "C"}; slashes without surrounding spaces are
    // kept. An empty line gives no artists rather than one empty name.
    static std::vector<std::string> split_artists(const std::string& line);

    // "playing" -> "Playing"
    static std::string playback_status(core::PlaybackState state);

private:
    TranslatorOptions m_options;
};

} // namespace roon_mpris::services

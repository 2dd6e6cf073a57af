#include "roon_mpris/services/bridge/zone_translator.hpp"
#include "roon_mpris/services/bridge/image_resolver.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <regex>

namespace roon_mpris::services {

namespace {
    const std::regex ARTIST_SEPARATOR(R"(\s+/\s+)");
}

ZoneTranslator::ZoneTranslator(TranslatorOptions options) : m_options(options) {}

Translation ZoneTranslator::translate(const core::ZoneSnapshot& snapshot,
                                      const core::Connection& connection) const {
    Translation result;
    auto& state = result.state;

    std::optional<std::string> art_url;
    std::vector<std::string> artists;
    if (snapshot.now_playing) {
        const auto& now_playing = *snapshot.now_playing;
        art_url = resolve_image_url(connection.base_address, now_playing.image_key);
        artists = split_artists(now_playing.three_line.line2);

        core::TrackMetadata metadata;
        metadata.length_us = now_playing.length ? seconds_to_microseconds(*now_playing.length) : 0;
        metadata.art_url = art_url;
        metadata.title = now_playing.three_line.line1;
        metadata.album = now_playing.three_line.line3;
        metadata.artists = artists;
        state.metadata = std::move(metadata);
    }

    state.playback_status = playback_status(snapshot.state);
    state.can_go_next = snapshot.is_next_allowed;
    state.can_go_previous = snapshot.is_previous_allowed;
    state.can_pause = snapshot.is_pause_allowed;
    state.can_seek = snapshot.is_seek_allowed;
    if (m_options.map_can_play) {
        state.can_play = snapshot.is_play_allowed;
    }

    if (snapshot.state == core::PlaybackState::Playing && snapshot.now_playing) {
        core::NotificationRequest request;
        request.title_parts = std::move(artists);
        request.message = snapshot.now_playing->three_line.line1;
        request.artwork_url = std::move(art_url);
        result.notification = std::move(request);
    }

    return result;
}

std::int64_t ZoneTranslator::seconds_to_microseconds(double seconds) {
    constexpr auto max_us = std::numeric_limits<std::int64_t>::max();
    const double microseconds = seconds * 1'000'000.0;
    if (!(microseconds > 0.0)) {
        return 0;
    }
    if (microseconds >= static_cast<double>(max_us)) {
        return max_us;
    }
    return static_cast<std::int64_t>(std::llround(microseconds));
}

std::vector<std::string> ZoneTranslator::split_artists(const std::string& line) {
    std::vector<std::string> artists;
    if (line.empty()) {
        return artists;
    }

    std::sregex_token_iterator it(line.begin(), line.end(), ARTIST_SEPARATOR, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        artists.push_back(it->str());
    }
    return artists;
}

std::string ZoneTranslator::playback_status(core::PlaybackState state) {
    std::string status = core::to_string(state);
    status[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(status[0])));
    return status;
}

} // namespace roon_mpris::services

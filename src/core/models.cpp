#include "roon_mpris/core/models.hpp"

namespace roon_mpris {
namespace core {

std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation failed";
        case ConfigError::PermissionDenied: return "permission denied";
    }
    return "unknown configuration error";
}

std::string to_string(RoonError error) {
    switch (error) {
        case RoonError::NotConnected: return "not connected";
        case RoonError::NotPaired: return "not paired";
        case RoonError::InvalidMessage: return "invalid message";
        case RoonError::RequestFailed: return "request failed";
    }
    return "unknown roon error";
}

std::string to_string(TranslateError error) {
    switch (error) {
        case TranslateError::MissingField: return "missing field";
        case TranslateError::UnknownPlaybackState: return "unknown playback state";
    }
    return "unknown translate error";
}

std::optional<PlaybackState> playback_state_from_string(std::string_view value) {
    if (value == "playing") return PlaybackState::Playing;
    if (value == "paused") return PlaybackState::Paused;
    if (value == "stopped") return PlaybackState::Stopped;
    if (value == "loading") return PlaybackState::Loading;
    return std::nullopt;
}

std::string to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused: return "paused";
        case PlaybackState::Stopped: return "stopped";
        case PlaybackState::Loading: return "loading";
    }
    return "stopped";
}

bool ApplicationConfig::is_valid() const {
    if (roon.port < 1 || roon.port > 65535) {
        return false;
    }
    if (mpris.bus_name.empty() || mpris.identity.empty()) {
        return false;
    }
    if (notifications.artwork_path.empty()) {
        return false;
    }
    if (zone && zone->name.empty()) {
        return false;
    }
    return true;
}

} // namespace core
} // namespace roon_mpris

#pragma once

#include "roon_mpris/utils/logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roon_mpris {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ServiceUnavailable,
    ConfigurationError,
    AlreadyRunning
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

enum class RoonError {
    NotConnected,
    NotPaired,
    InvalidMessage,
    RequestFailed
};

enum class TranslateError {
    MissingField,
    UnknownPlaybackState
};

std::string to_string(ConfigError error);
std::string to_string(RoonError error);
std::string to_string(TranslateError error);

// ============================================================================
// Roon side: what the core tells us about a zone
// ============================================================================

enum class PlaybackState {
    Playing,
    Paused,
    Stopped,
    Loading
};

std::optional<PlaybackState> playback_state_from_string(std::string_view value);
std::string to_string(PlaybackState state);

// Roon's title / artists / album rendering of the current track
struct ThreeLine {
    std::string line1;
    std::string line2;
    std::string line3;
};

struct NowPlaying {
    std::optional<double> length;  // seconds
    std::optional<std::string> image_key;
    ThreeLine three_line;
    std::optional<double> seek_position;  // seconds
};

struct ZoneSnapshot {
    std::string zone_id;
    std::string display_name;
    PlaybackState state = PlaybackState::Stopped;
    bool is_next_allowed = false;
    bool is_previous_allowed = false;
    bool is_pause_allowed = false;
    bool is_play_allowed = false;
    bool is_seek_allowed = false;
    std::optional<NowPlaying> now_playing;
};

// A paired core; base_address is the host:port its HTTP/WebSocket API answers on
struct Connection {
    std::string core_id;
    std::string display_name;
    std::string display_version;
    std::string base_address;
};

// ============================================================================
// MPRIS side: what the desktop sees
// ============================================================================

struct TrackMetadata {
    std::int64_t length_us = 0;
    std::optional<std::string> art_url;
    std::string title;
    std::string album;
    std::vector<std::string> artists;

    bool operator==(const TrackMetadata&) const = default;
};

struct PlayerState {
    std::optional<TrackMetadata> metadata;
    std::string playback_status;
    bool can_go_next = false;
    bool can_go_previous = false;
    bool can_pause = false;
    bool can_seek = false;
    std::optional<bool> can_play;  // only set when mapping is enabled
};

struct NotificationRequest {
    std::vector<std::string> title_parts;
    std::string message;
    std::optional<std::string> artwork_url;
};

// ============================================================================
// Configuration
// ============================================================================

struct ZoneSelection {
    std::string name;
    std::string output_id;

    bool operator==(const ZoneSelection&) const = default;
};

struct RoonConfig {
    std::string host;       // empty means SOOD discovery
    int port = 9100;
    bool log_traffic = false;

    bool operator==(const RoonConfig&) const = default;
};

struct MprisConfig {
    std::string bus_name = "roon";
    std::string identity = "Roon";
    bool map_can_play = false;

    bool operator==(const MprisConfig&) const = default;
};

struct NotificationConfig {
    bool enabled = true;
    std::string artwork_path = "/tmp/roon-mpris-cover";
    bool require_artwork = true;

    bool operator==(const NotificationConfig&) const = default;
};

struct ApplicationConfig {
    utils::LogLevel log_level = utils::LogLevel::Info;
    std::optional<ZoneSelection> zone;
    RoonConfig roon;
    MprisConfig mpris;
    NotificationConfig notifications;

    bool is_valid() const;
};

} // namespace core
} // namespace roon_mpris

#pragma once

#include "roon_mpris/platform/media_player.hpp"
#include "roon_mpris/platform/ui_service.hpp"
#include <QVariantMap>
#include <QString>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

class QObject;

namespace roon_mpris::platform::mpris {

class RootAdaptor;
class PlayerAdaptor;

struct MprisOptions {
    std::string bus_name = "roon";
    std::string identity = "Roon";
};

/**
 * @brief MediaPlayer exported on the session bus as org.mpris.MediaPlayer2.<bus_name>
 *
 * Property writes from the bridge are announced with
 * org.freedesktop.DBus.Properties.PropertiesChanged, except Position which
 * clients poll. A position update that lands away from where playback should
 * be is announced with the Player's Seeked signal instead. Must be used from
 * the Qt main thread.
 */
class MprisPlayer : public MediaPlayer {
public:
    using SeekedCallback = std::function<void(std::int64_t position_us)>;

    static constexpr const char* OBJECT_PATH = "/org/mpris/MediaPlayer2";
    static constexpr const char* PLAYER_INTERFACE = "org.mpris.MediaPlayer2.Player";

    // Drift between the reported and the expected position that counts as a seek
    static constexpr std::int64_t SEEK_THRESHOLD_US = 2'000'000;

    explicit MprisPlayer(MprisOptions options);
    ~MprisPlayer() override;

    MprisPlayer(const MprisPlayer&) = delete;
    MprisPlayer& operator=(const MprisPlayer&) = delete;

    std::expected<void, UiError> initialize();
    void shutdown();

    // MediaPlayer
    void set_metadata(const core::TrackMetadata& metadata) override;
    void set_playback_status(const std::string& status) override;
    void set_can_go_next(bool value) override;
    void set_can_go_previous(bool value) override;
    void set_can_pause(bool value) override;
    void set_can_seek(bool value) override;
    void set_can_play(bool value) override;
    void set_position(std::int64_t position_us) override;

    void set_command_callback(CommandCallback callback) override;
    void set_event_callback(EventCallback callback) override;
    void set_position_provider(PositionProvider provider) override;

    // Read by the D-Bus adaptors
    QString identity() const { return QString::fromStdString(m_options.identity); }
    QString playback_status() const { return m_playback_status; }
    QVariantMap metadata_map() const { return m_metadata_map; }
    std::int64_t position() const;
    bool can_go_next() const { return m_can_go_next; }
    bool can_go_previous() const { return m_can_go_previous; }
    bool can_play() const { return m_can_play; }
    bool can_pause() const { return m_can_pause; }
    bool can_seek() const { return m_can_seek; }

    // Called by the adaptors for incoming method calls
    void dispatch_command(PlayerCommand command);
    void dispatch_event(PlayerEvent event, const std::string& detail = {});
    void set_seeked_callback(SeekedCallback callback);

    static QVariantMap to_metadata_map(const core::TrackMetadata& metadata, int track_number);
    static bool is_seek(std::int64_t expected_us, std::int64_t position_us);

private:
    void update_flag(bool& field, bool value, const char* property);
    void properties_changed(const QVariantMap& changed);

    MprisOptions m_options;
    std::unique_ptr<QObject> m_host;
    RootAdaptor* m_root_adaptor = nullptr;
    PlayerAdaptor* m_player_adaptor = nullptr;
    QString m_service_name;
    bool m_registered = false;

    std::optional<core::TrackMetadata> m_metadata;
    QVariantMap m_metadata_map;
    int m_track_number = 0;
    QString m_playback_status = QStringLiteral("Stopped");
    bool m_can_go_next = false;
    bool m_can_go_previous = false;
    bool m_can_play = true;
    bool m_can_pause = false;
    bool m_can_seek = false;
    std::int64_t m_position_us = 0;
    // Unset until the first position of the current track arrives
    std::optional<std::chrono::steady_clock::time_point> m_position_time;

    CommandCallback m_on_command;
    EventCallback m_on_event;
    PositionProvider m_position_provider;
    SeekedCallback m_on_seeked;
};

} // namespace roon_mpris::platform::mpris

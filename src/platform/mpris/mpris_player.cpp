#include "roon_mpris/platform/mpris/mpris_player.hpp"
#include "roon_mpris/platform/mpris/mpris_adaptors.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QObject>
#include <QStringList>
#include <cstdlib>

namespace roon_mpris::platform::mpris {

namespace {
    constexpr std::string_view COMPONENT = "MprisPlayer";
    const QString SERVICE_PREFIX = QStringLiteral("org.mpris.MediaPlayer2.");
}

MprisPlayer::MprisPlayer(MprisOptions options)
    : m_options(std::move(options)) {
}

MprisPlayer::~MprisPlayer() {
    shutdown();
}

std::expected<void, UiError> MprisPlayer::initialize() {
    if (m_registered) {
        return {};
    }

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        LOG_ERROR(COMPONENT, "Session bus unavailable: " + bus.lastError().message().toStdString());
        return std::unexpected(UiError::NotSupported);
    }

    m_host = std::make_unique<QObject>();
    m_root_adaptor = new RootAdaptor(m_host.get(), *this);
    m_player_adaptor = new PlayerAdaptor(m_host.get(), *this);

    if (!bus.registerObject(QString::fromLatin1(OBJECT_PATH), m_host.get(), QDBusConnection::ExportAdaptors)) {
        LOG_ERROR(COMPONENT, "Failed to register " + std::string(OBJECT_PATH) + ": " +
                  bus.lastError().message().toStdString());
        m_host.reset();
        return std::unexpected(UiError::InitializationFailed);
    }

    // A second instance takes a unique suffix, as the MPRIS naming rules allow
    m_service_name = SERVICE_PREFIX + QString::fromStdString(m_options.bus_name);
    if (!bus.registerService(m_service_name)) {
        m_service_name += QStringLiteral(".instance") + QString::number(QCoreApplication::applicationPid());
        if (!bus.registerService(m_service_name)) {
            LOG_ERROR(COMPONENT, "Failed to acquire bus name: " + bus.lastError().message().toStdString());
            bus.unregisterObject(QString::fromLatin1(OBJECT_PATH));
            m_host.reset();
            return std::unexpected(UiError::InitializationFailed);
        }
    }

    m_registered = true;
    LOG_INFO(COMPONENT, "Registered " + m_service_name.toStdString());
    return {};
}

void MprisPlayer::shutdown() {
    if (!m_registered) {
        return;
    }

    QDBusConnection bus = QDBusConnection::sessionBus();
    bus.unregisterService(m_service_name);
    bus.unregisterObject(QString::fromLatin1(OBJECT_PATH));
    m_host.reset();
    m_root_adaptor = nullptr;
    m_player_adaptor = nullptr;
    m_registered = false;
    LOG_DEBUG(COMPONENT, "Unregistered " + m_service_name.toStdString());
}

QVariantMap MprisPlayer::to_metadata_map(const core::TrackMetadata& metadata, int track_number) {
    QStringList artists;
    for (const auto& artist : metadata.artists) {
        artists << QString::fromStdString(artist);
    }

    QVariantMap map;
    map.insert(QStringLiteral("mpris:trackid"), QVariant::fromValue(QDBusObjectPath(
        QStringLiteral("/org/mpris/MediaPlayer2/Track/") + QString::number(track_number))));
    map.insert(QStringLiteral("mpris:length"), static_cast<qlonglong>(metadata.length_us));
    if (metadata.art_url) {
        map.insert(QStringLiteral("mpris:artUrl"), QString::fromStdString(*metadata.art_url));
    }
    map.insert(QStringLiteral("xesam:title"), QString::fromStdString(metadata.title));
    map.insert(QStringLiteral("xesam:album"), QString::fromStdString(metadata.album));
    map.insert(QStringLiteral("xesam:artist"), artists);
    return map;
}

void MprisPlayer::set_metadata(const core::TrackMetadata& metadata) {
    if (m_metadata == metadata) {
        return;
    }
    m_metadata = metadata;
    m_position_time.reset();
    m_metadata_map = to_metadata_map(metadata, ++m_track_number);
    properties_changed({{QStringLiteral("Metadata"), m_metadata_map}});
}

void MprisPlayer::set_playback_status(const std::string& status) {
    QString value = QString::fromStdString(status);
    if (m_playback_status == value) {
        return;
    }
    if (m_position_time) {
        // Time spent in the previous state is not drift
        m_position_time = std::chrono::steady_clock::now();
    }
    m_playback_status = value;
    properties_changed({{QStringLiteral("PlaybackStatus"), value}});
}

void MprisPlayer::set_can_go_next(bool value) {
    update_flag(m_can_go_next, value, "CanGoNext");
}

void MprisPlayer::set_can_go_previous(bool value) {
    update_flag(m_can_go_previous, value, "CanGoPrevious");
}

void MprisPlayer::set_can_pause(bool value) {
    update_flag(m_can_pause, value, "CanPause");
}

void MprisPlayer::set_can_seek(bool value) {
    update_flag(m_can_seek, value, "CanSeek");
}

void MprisPlayer::set_can_play(bool value) {
    update_flag(m_can_play, value, "CanPlay");
}

void MprisPlayer::set_position(std::int64_t position_us) {
    const auto now = std::chrono::steady_clock::now();
    if (m_position_time) {
        std::int64_t expected_us = m_position_us;
        if (m_playback_status == QStringLiteral("Playing")) {
            expected_us += std::chrono::duration_cast<std::chrono::microseconds>(now - *m_position_time).count();
        }
        if (is_seek(expected_us, position_us) && m_on_seeked) {
            LOG_DEBUG(COMPONENT, "Seeked to " + std::to_string(position_us) + "us");
            m_on_seeked(position_us);
        }
    }

    m_position_us = position_us;
    m_position_time = now;
}

bool MprisPlayer::is_seek(std::int64_t expected_us, std::int64_t position_us) {
    return std::llabs(position_us - expected_us) > SEEK_THRESHOLD_US;
}

void MprisPlayer::set_seeked_callback(SeekedCallback callback) {
    m_on_seeked = std::move(callback);
}

std::int64_t MprisPlayer::position() const {
    if (m_position_provider) {
        return m_position_provider();
    }
    return m_position_us;
}

void MprisPlayer::set_command_callback(CommandCallback callback) {
    m_on_command = std::move(callback);
}

void MprisPlayer::set_event_callback(EventCallback callback) {
    m_on_event = std::move(callback);
}

void MprisPlayer::set_position_provider(PositionProvider provider) {
    m_position_provider = std::move(provider);
}

void MprisPlayer::dispatch_command(PlayerCommand command) {
    LOG_DEBUG(COMPONENT, "Command " + std::string(to_string(command)));
    if (m_on_command) {
        m_on_command(command);
    }
}

void MprisPlayer::dispatch_event(PlayerEvent event, const std::string& detail) {
    if (m_on_event) {
        m_on_event(event, detail);
    }
}

void MprisPlayer::update_flag(bool& field, bool value, const char* property) {
    if (field == value) {
        return;
    }
    field = value;
    properties_changed({{QString::fromLatin1(property), value}});
}

void MprisPlayer::properties_changed(const QVariantMap& changed) {
    if (!m_registered) {
        return;
    }

    QDBusMessage signal = QDBusMessage::createSignal(
        QString::fromLatin1(OBJECT_PATH),
        QStringLiteral("org.freedesktop.DBus.Properties"),
        QStringLiteral("PropertiesChanged"));
    signal << QString::fromLatin1(PLAYER_INTERFACE) << changed << QStringList();

    if (!QDBusConnection::sessionBus().send(signal)) {
        LOG_WARNING(COMPONENT, "Failed to announce property change");
    }
}

} // namespace roon_mpris::platform::mpris

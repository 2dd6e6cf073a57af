#include "roon_mpris/platform/mpris/mpris_adaptors.hpp"
#include "roon_mpris/platform/mpris/mpris_player.hpp"
#include "roon_mpris/utils/logger.hpp"

namespace roon_mpris::platform::mpris {

RootAdaptor::RootAdaptor(QObject* parent, MprisPlayer& player)
    : QDBusAbstractAdaptor(parent), m_player(player) {
}

QString RootAdaptor::identity() const {
    return m_player.identity();
}

QStringList RootAdaptor::supported_uri_schemes() const {
    return {QStringLiteral("file")};
}

QStringList RootAdaptor::supported_mime_types() const {
    return {QStringLiteral("audio/mpeg"), QStringLiteral("application/ogg")};
}

void RootAdaptor::Raise() {
    m_player.dispatch_event(PlayerEvent::Raise);
}

void RootAdaptor::Quit() {
    m_player.dispatch_event(PlayerEvent::Quit);
}

PlayerAdaptor::PlayerAdaptor(QObject* parent, MprisPlayer& player)
    : QDBusAbstractAdaptor(parent), m_player(player) {
    m_player.set_seeked_callback([this](std::int64_t position_us) {
        emit Seeked(static_cast<qlonglong>(position_us));
    });
}

PlayerAdaptor::~PlayerAdaptor() {
    m_player.set_seeked_callback(nullptr);
}

QString PlayerAdaptor::playback_status() const {
    return m_player.playback_status();
}

void PlayerAdaptor::set_loop_status(const QString& value) {
    m_player.dispatch_event(PlayerEvent::LoopStatus, value.toStdString());
}

void PlayerAdaptor::set_rate(double value) {
    LOG_DEBUG("MprisPlayer", "Ignoring Rate write " + std::to_string(value));
}

void PlayerAdaptor::set_shuffle(bool value) {
    m_player.dispatch_event(PlayerEvent::Shuffle, value ? "true" : "false");
}

QVariantMap PlayerAdaptor::metadata() const {
    return m_player.metadata_map();
}

void PlayerAdaptor::set_volume(double value) {
    m_player.dispatch_event(PlayerEvent::Volume, std::to_string(value));
}

qlonglong PlayerAdaptor::position() const {
    return static_cast<qlonglong>(m_player.position());
}

bool PlayerAdaptor::can_go_next() const {
    return m_player.can_go_next();
}

bool PlayerAdaptor::can_go_previous() const {
    return m_player.can_go_previous();
}

bool PlayerAdaptor::can_play() const {
    return m_player.can_play();
}

bool PlayerAdaptor::can_pause() const {
    return m_player.can_pause();
}

bool PlayerAdaptor::can_seek() const {
    return m_player.can_seek();
}

void PlayerAdaptor::Next() {
    m_player.dispatch_command(PlayerCommand::Next);
}

void PlayerAdaptor::Previous() {
    m_player.dispatch_command(PlayerCommand::Previous);
}

void PlayerAdaptor::Pause() {
    m_player.dispatch_event(PlayerEvent::Pause);
}

void PlayerAdaptor::PlayPause() {
    m_player.dispatch_command(PlayerCommand::PlayPause);
}

void PlayerAdaptor::Stop() {
    m_player.dispatch_command(PlayerCommand::Stop);
}

void PlayerAdaptor::Play() {
    m_player.dispatch_event(PlayerEvent::Play);
}

void PlayerAdaptor::Seek(qlonglong offset) {
    m_player.dispatch_event(PlayerEvent::Seek, std::to_string(offset));
}

void PlayerAdaptor::SetPosition(const QDBusObjectPath& track_id, qlonglong position) {
    m_player.dispatch_event(PlayerEvent::SetPosition,
                            track_id.path().toStdString() + " " + std::to_string(position));
}

void PlayerAdaptor::OpenUri(const QString& uri) {
    m_player.dispatch_event(PlayerEvent::OpenUri, uri.toStdString());
}

} // namespace roon_mpris::platform::mpris

#pragma once

#include <QDBusAbstractAdaptor>
#include <QDBusObjectPath>
#include <QStringList>
#include <QVariantMap>

namespace roon_mpris::platform::mpris {

class MprisPlayer;

// org.mpris.MediaPlayer2
class RootAdaptor : public QDBusAbstractAdaptor {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.mpris.MediaPlayer2")
    Q_PROPERTY(bool CanQuit READ can_quit)
    Q_PROPERTY(bool CanRaise READ can_raise)
    Q_PROPERTY(bool HasTrackList READ has_track_list)
    Q_PROPERTY(QString Identity READ identity)
    Q_PROPERTY(QStringList SupportedUriSchemes READ supported_uri_schemes)
    Q_PROPERTY(QStringList SupportedMimeTypes READ supported_mime_types)

public:
    RootAdaptor(QObject* parent, MprisPlayer& player);

    bool can_quit() const { return true; }
    bool can_raise() const { return false; }
    bool has_track_list() const { return false; }
    QString identity() const;
    QStringList supported_uri_schemes() const;
    QStringList supported_mime_types() const;

public slots:
    void Raise();
    void Quit();

private:
    MprisPlayer& m_player;
};

// org.mpris.MediaPlayer2.Player
class PlayerAdaptor : public QDBusAbstractAdaptor {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.mpris.MediaPlayer2.Player")
    Q_PROPERTY(QString PlaybackStatus READ playback_status)
    Q_PROPERTY(QString LoopStatus READ loop_status WRITE set_loop_status)
    Q_PROPERTY(double Rate READ rate WRITE set_rate)
    Q_PROPERTY(bool Shuffle READ shuffle WRITE set_shuffle)
    Q_PROPERTY(QVariantMap Metadata READ metadata)
    Q_PROPERTY(double Volume READ volume WRITE set_volume)
    Q_PROPERTY(qlonglong Position READ position)
    Q_PROPERTY(double MinimumRate READ minimum_rate)
    Q_PROPERTY(double MaximumRate READ maximum_rate)
    Q_PROPERTY(bool CanGoNext READ can_go_next)
    Q_PROPERTY(bool CanGoPrevious READ can_go_previous)
    Q_PROPERTY(bool CanPlay READ can_play)
    Q_PROPERTY(bool CanPause READ can_pause)
    Q_PROPERTY(bool CanSeek READ can_seek)
    Q_PROPERTY(bool CanControl READ can_control)

public:
    PlayerAdaptor(QObject* parent, MprisPlayer& player);
    ~PlayerAdaptor() override;

    QString playback_status() const;
    QString loop_status() const { return QStringLiteral("None"); }
    void set_loop_status(const QString& value);
    double rate() const { return 1.0; }
    void set_rate(double value);
    bool shuffle() const { return false; }
    void set_shuffle(bool value);
    QVariantMap metadata() const;
    double volume() const { return 1.0; }
    void set_volume(double value);
    qlonglong position() const;
    double minimum_rate() const { return 1.0; }
    double maximum_rate() const { return 1.0; }
    bool can_go_next() const;
    bool can_go_previous() const;
    bool can_play() const;
    bool can_pause() const;
    bool can_seek() const;
    bool can_control() const { return true; }

public slots:
    void Next();
    void Previous();
    void Pause();
    void PlayPause();
    void Stop();
    void Play();
    void Seek(qlonglong offset);
    void SetPosition(const QDBusObjectPath& track_id, qlonglong position);
    void OpenUri(const QString& uri);

signals:
    void Seeked(qlonglong position);

private:
    MprisPlayer& m_player;
};

} // namespace roon_mpris::platform::mpris

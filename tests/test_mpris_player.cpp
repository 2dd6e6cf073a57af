#include <QTest>
#include <QSignalSpy>
#include "roon_mpris/platform/mpris/mpris_adaptors.hpp"
#include "roon_mpris/platform/mpris/mpris_player.hpp"

using namespace roon_mpris;
using platform::PlayerCommand;
using platform::PlayerEvent;
using platform::mpris::MprisPlayer;

namespace {

core::TrackMetadata track(const std::string& title) {
    core::TrackMetadata metadata;
    metadata.length_us = 245'000'000;
    metadata.art_url = "http://10.0.0.5:9330/image/k";
    metadata.title = title;
    metadata.album = "Album";
    metadata.artists = {"A", "B"};
    return metadata;
}

} // namespace

class TestMprisPlayer : public QObject {
    Q_OBJECT
private slots:
    void testMetadataMap() {
        auto map = MprisPlayer::to_metadata_map(track("Song"), 3);

        QCOMPARE(map.value("mpris:trackid").value<QDBusObjectPath>().path(),
                 QStringLiteral("/org/mpris/MediaPlayer2/Track/3"));
        QCOMPARE(map.value("mpris:length").toLongLong(), 245'000'000LL);
        QCOMPARE(map.value("mpris:artUrl").toString(), QStringLiteral("http://10.0.0.5:9330/image/k"));
        QCOMPARE(map.value("xesam:title").toString(), QStringLiteral("Song"));
        QCOMPARE(map.value("xesam:album").toString(), QStringLiteral("Album"));
        QCOMPARE(map.value("xesam:artist").toStringList(), (QStringList{"A", "B"}));
    }

    void testMetadataWithoutArt() {
        auto metadata = track("Song");
        metadata.art_url.reset();
        QVERIFY(!MprisPlayer::to_metadata_map(metadata, 1).contains("mpris:artUrl"));
    }

    void testTrackIdOnlyAdvancesOnChange() {
        MprisPlayer player(platform::mpris::MprisOptions{});
        player.set_metadata(track("One"));
        const auto first = player.metadata_map().value("mpris:trackid").value<QDBusObjectPath>().path();

        player.set_metadata(track("One"));
        QCOMPARE(player.metadata_map().value("mpris:trackid").value<QDBusObjectPath>().path(), first);

        player.set_metadata(track("Two"));
        QVERIFY(player.metadata_map().value("mpris:trackid").value<QDBusObjectPath>().path() != first);
    }

    void testDefaults() {
        MprisPlayer player(platform::mpris::MprisOptions{"roon", "Roon"});
        QCOMPARE(player.identity(), QStringLiteral("Roon"));
        QCOMPARE(player.playback_status(), QStringLiteral("Stopped"));
        QVERIFY(player.can_play());
        QVERIFY(!player.can_go_next());
        QVERIFY(!player.can_seek());
    }

    void testPositionPrefersProvider() {
        MprisPlayer player(platform::mpris::MprisOptions{});
        player.set_position(5'000'000);
        QCOMPARE(player.position(), std::int64_t{5'000'000});

        player.set_position_provider([]() { return std::int64_t{7'000'000}; });
        QCOMPARE(player.position(), std::int64_t{7'000'000});
    }

    void testSeekDetection() {
        QVERIFY(!MprisPlayer::is_seek(10'000'000, 11'500'000));
        QVERIFY(!MprisPlayer::is_seek(10'000'000, 8'500'000));
        QVERIFY(MprisPlayer::is_seek(10'000'000, 60'000'000));
        QVERIFY(MprisPlayer::is_seek(60'000'000, 0));
    }

    void testPositionJumpEmitsSeeked() {
        MprisPlayer player(platform::mpris::MprisOptions{});
        QObject host;
        platform::mpris::PlayerAdaptor adaptor(&host, player);
        QSignalSpy seeked(&adaptor, &platform::mpris::PlayerAdaptor::Seeked);

        player.set_playback_status("Paused");
        player.set_metadata(track("Song"));
        player.set_position(5'000'000);
        player.set_position(5'000'000);
        QCOMPARE(seeked.count(), 0);

        player.set_position(90'000'000);
        QCOMPARE(seeked.count(), 1);
        QCOMPARE(seeked.at(0).at(0).toLongLong(), 90'000'000LL);

        player.set_position(90'500'000);
        QCOMPARE(seeked.count(), 1);
    }

    void testNewTrackPositionIsNotSeek() {
        MprisPlayer player(platform::mpris::MprisOptions{});
        QObject host;
        platform::mpris::PlayerAdaptor adaptor(&host, player);
        QSignalSpy seeked(&adaptor, &platform::mpris::PlayerAdaptor::Seeked);

        player.set_playback_status("Playing");
        player.set_metadata(track("One"));
        player.set_position(200'000'000);
        player.set_metadata(track("Two"));
        player.set_position(0);

        QCOMPARE(seeked.count(), 0);
    }

    void testAdaptorsReadPlayerState() {
        MprisPlayer player(platform::mpris::MprisOptions{"roon", "Roon"});
        player.set_playback_status("Playing");
        player.set_can_go_next(true);
        player.set_can_pause(true);
        player.set_metadata(track("Song"));

        QObject host;
        platform::mpris::RootAdaptor root(&host, player);
        platform::mpris::PlayerAdaptor adaptor(&host, player);

        QVERIFY(root.can_quit());
        QVERIFY(!root.can_raise());
        QCOMPARE(root.identity(), QStringLiteral("Roon"));
        QCOMPARE(adaptor.playback_status(), QStringLiteral("Playing"));
        QVERIFY(adaptor.can_go_next());
        QVERIFY(adaptor.can_pause());
        QVERIFY(adaptor.can_control());
        QCOMPARE(adaptor.rate(), 1.0);
        QCOMPARE(adaptor.metadata().value("xesam:title").toString(), QStringLiteral("Song"));
    }

    void testAdaptorRelaysCommands() {
        MprisPlayer player(platform::mpris::MprisOptions{});
        std::vector<PlayerCommand> commands;
        std::vector<PlayerEvent> events;
        player.set_command_callback([&commands](PlayerCommand command) { commands.push_back(command); });
        player.set_event_callback([&events](PlayerEvent event, const std::string&) { events.push_back(event); });

        QObject host;
        platform::mpris::RootAdaptor root(&host, player);
        platform::mpris::PlayerAdaptor adaptor(&host, player);

        adaptor.PlayPause();
        adaptor.Next();
        adaptor.Previous();
        adaptor.Stop();
        adaptor.Play();
        adaptor.Seek(1000);
        adaptor.set_volume(0.5);
        root.Quit();

        QCOMPARE(commands, (std::vector<PlayerCommand>{
            PlayerCommand::PlayPause, PlayerCommand::Next, PlayerCommand::Previous, PlayerCommand::Stop}));
        QCOMPARE(events, (std::vector<PlayerEvent>{
            PlayerEvent::Play, PlayerEvent::Seek, PlayerEvent::Volume, PlayerEvent::Quit}));
    }
};

QTEST_MAIN(TestMprisPlayer)
#include "test_mpris_player.moc"

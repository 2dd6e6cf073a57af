#include <QTest>
#include "roon_mpris/services/bridge/image_resolver.hpp"
#include "roon_mpris/services/bridge/zone_translator.hpp"
#include <limits>

using namespace roon_mpris;
using services::ZoneTranslator;

namespace {

core::Connection connection() {
    return core::Connection{"core-1", "Roon Core", "2.0", "192.168.1.10:9330"};
}

core::ZoneSnapshot playing_zone() {
    core::NowPlaying now_playing;
    now_playing.length = 245.5;
    now_playing.image_key = "abc123";
    now_playing.three_line = {"Song Title", "Artist One / Artist Two", "Album Name"};
    now_playing.seek_position = 10.0;

    core::ZoneSnapshot zone;
    zone.zone_id = "zone-1";
    zone.display_name = "Living Room";
    zone.state = core::PlaybackState::Playing;
    zone.is_next_allowed = true;
    zone.is_previous_allowed = false;
    zone.is_pause_allowed = true;
    zone.is_play_allowed = false;
    zone.is_seek_allowed = true;
    zone.now_playing = now_playing;
    return zone;
}

} // namespace

class TestZoneTranslator : public QObject {
    Q_OBJECT
private slots:
    void testResolveImageUrl() {
        auto url = services::resolve_image_url("192.168.1.10:9330", std::string("abc123"));
        QVERIFY(url.has_value());
        QCOMPARE(*url, std::string("http://192.168.1.10:9330/image/abc123"));
    }

    void testResolveImageUrlWithoutKey() {
        QVERIFY(!services::resolve_image_url("192.168.1.10:9330", std::nullopt).has_value());
    }

    void testResolveImageUrlDoesNotValidateAddress() {
        auto url = services::resolve_image_url("", std::string("k"));
        QCOMPARE(*url, std::string("http:///image/k"));
    }

    void testMetadataMapping() {
        ZoneTranslator translator;
        auto result = translator.translate(playing_zone(), connection());

        QVERIFY(result.state.metadata.has_value());
        const auto& metadata = *result.state.metadata;
        QCOMPARE(metadata.length_us, std::int64_t{245'500'000});
        QCOMPARE(*metadata.art_url, std::string("http://192.168.1.10:9330/image/abc123"));
        QCOMPARE(metadata.title, std::string("Song Title"));
        QCOMPARE(metadata.album, std::string("Album Name"));
        QCOMPARE(metadata.artists, (std::vector<std::string>{"Artist One", "Artist Two"}));
    }

    void testMissingLengthMapsToZero() {
        auto zone = playing_zone();
        zone.now_playing->length.reset();

        auto result = ZoneTranslator{}.translate(zone, connection());
        QCOMPARE(result.state.metadata->length_us, std::int64_t{0});
    }

    void testNoNowPlayingLeavesMetadataUnset() {
        auto zone = playing_zone();
        zone.now_playing.reset();
        zone.state = core::PlaybackState::Stopped;

        auto result = ZoneTranslator{}.translate(zone, connection());
        QVERIFY(!result.state.metadata.has_value());
        QCOMPARE(result.state.playback_status, std::string("Stopped"));
    }

    void testFlagsCopiedVerbatim() {
        auto result = ZoneTranslator{}.translate(playing_zone(), connection());
        QCOMPARE(result.state.playback_status, std::string("Playing"));
        QVERIFY(result.state.can_go_next);
        QVERIFY(!result.state.can_go_previous);
        QVERIFY(result.state.can_pause);
        QVERIFY(result.state.can_seek);
    }

    void testCanPlayNotMappedByDefault() {
        auto result = ZoneTranslator{}.translate(playing_zone(), connection());
        QVERIFY(!result.state.can_play.has_value());
    }

    void testCanPlayMappedWhenEnabled() {
        ZoneTranslator translator(services::TranslatorOptions{true});
        auto result = translator.translate(playing_zone(), connection());
        QVERIFY(result.state.can_play.has_value());
        QCOMPARE(*result.state.can_play, false);
    }

    void testPlaybackStatusCapitalised() {
        QCOMPARE(ZoneTranslator::playback_status(core::PlaybackState::Paused), std::string("Paused"));
        QCOMPARE(ZoneTranslator::playback_status(core::PlaybackState::Loading), std::string("Loading"));
    }

    void testSplitArtists() {
        QCOMPARE(ZoneTranslator::split_artists("A / B / C"), (std::vector<std::string>{"A", "B", "C"}));
        QCOMPARE(ZoneTranslator::split_artists("AC/DC"), (std::vector<std::string>{"AC/DC"}));
        QCOMPARE(ZoneTranslator::split_artists("Solo Artist"), (std::vector<std::string>{"Solo Artist"}));
        // An empty line is no artists, so xesam:artist stays an empty list
        QVERIFY(ZoneTranslator::split_artists("").empty());
    }

    void testSeekConversion() {
        QCOMPARE(ZoneTranslator::seconds_to_microseconds(12.5), std::int64_t{12'500'000});
        QCOMPARE(ZoneTranslator::seconds_to_microseconds(0.0), std::int64_t{0});
    }

    void testSeekConversionClamps() {
        constexpr auto max_us = std::numeric_limits<std::int64_t>::max();
        QCOMPARE(ZoneTranslator::seconds_to_microseconds(1e300), max_us);
        QCOMPARE(ZoneTranslator::seconds_to_microseconds(std::numeric_limits<double>::infinity()), max_us);
        QCOMPARE(ZoneTranslator::seconds_to_microseconds(-3.0), std::int64_t{0});
        QCOMPARE(ZoneTranslator::seconds_to_microseconds(std::numeric_limits<double>::quiet_NaN()), std::int64_t{0});
    }

    void testEmptyArtistLineGivesNoArtists() {
        auto zone = playing_zone();
        zone.now_playing->three_line.line2.clear();
        auto result = ZoneTranslator{}.translate(zone, connection());
        QVERIFY(result.state.metadata->artists.empty());
        QVERIFY(result.notification->title_parts.empty());
    }

    void testHugeLengthClamped() {
        auto zone = playing_zone();
        zone.now_playing->length = 1e300;
        auto result = ZoneTranslator{}.translate(zone, connection());
        QCOMPARE(result.state.metadata->length_us, std::numeric_limits<std::int64_t>::max());
    }

    void testNotificationWhenPlaying() {
        auto result = ZoneTranslator{}.translate(playing_zone(), connection());
        QVERIFY(result.notification.has_value());
        QCOMPARE(result.notification->title_parts, (std::vector<std::string>{"Artist One", "Artist Two"}));
        QCOMPARE(result.notification->message, std::string("Song Title"));
        QCOMPARE(*result.notification->artwork_url, std::string("http://192.168.1.10:9330/image/abc123"));
    }

    void testNoNotificationWhenPaused() {
        auto zone = playing_zone();
        zone.state = core::PlaybackState::Paused;
        QVERIFY(!ZoneTranslator{}.translate(zone, connection()).notification.has_value());
    }

    void testNoNotificationWithoutNowPlaying() {
        auto zone = playing_zone();
        zone.now_playing.reset();
        QVERIFY(!ZoneTranslator{}.translate(zone, connection()).notification.has_value());
    }
};

QTEST_MAIN(TestZoneTranslator)
#include "test_zone_translator.moc"

#include <QTest>
#include "fakes.hpp"
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/core/events.hpp"
#include "roon_mpris/services/bridge/session_orchestrator.hpp"

using namespace roon_mpris;
using services::SeekChange;
using services::SeekChanges;
using services::SessionOrchestrator;
using services::ZonesListing;

namespace {

core::Connection connection() {
    return core::Connection{"core-1", "Roon Core", "2.0", "10.0.0.5:9330"};
}

core::ZoneSnapshot zone(const std::string& id, const std::string& name, core::PlaybackState state) {
    core::NowPlaying now_playing;
    now_playing.length = 200.0;
    now_playing.image_key = "img-" + id;
    now_playing.three_line = {"Track " + id, "Band", "Record"};
    now_playing.seek_position = 3.0;

    core::ZoneSnapshot snapshot;
    snapshot.zone_id = id;
    snapshot.display_name = name;
    snapshot.state = state;
    snapshot.is_next_allowed = true;
    snapshot.is_pause_allowed = true;
    snapshot.is_play_allowed = false;
    snapshot.now_playing = now_playing;
    return snapshot;
}

ZonesListing listing(std::vector<core::ZoneSnapshot> zones,
                     ZonesListing::Kind kind = ZonesListing::Kind::Initial) {
    ZonesListing result;
    result.kind = kind;
    result.zones = std::move(zones);
    return result;
}

struct Harness {
    testing::FakeTransport transport;
    testing::FakePlayer player;
    std::optional<core::ZoneSelection> selection{core::ZoneSelection{"Kitchen", ""}};
    std::vector<core::NotificationRequest> notifications;
    SessionOrchestrator orchestrator;

    explicit Harness(services::TranslatorOptions options = {})
        : orchestrator(transport, player,
                       [this]() { return selection; },
                       [this](const core::NotificationRequest& request) { notifications.push_back(request); },
                       services::ZoneTranslator(options)) {}
};

} // namespace

class TestSessionOrchestrator : public QObject {
    Q_OBJECT
private slots:
    void testPairingSubscribes() {
        Harness h;
        QCOMPARE(h.transport.subscribe_count, 0);

        h.orchestrator.on_core_paired(connection());

        QCOMPARE(h.transport.subscribe_count, 1);
        QVERIFY(h.orchestrator.state().is_paired());
        QVERIFY(!h.orchestrator.state().zone.has_value());
    }

    void testEventsIgnoredWhileUnpaired() {
        Harness h;
        h.orchestrator.handle_zone_event(listing({zone("z1", "Kitchen", core::PlaybackState::Playing)}));

        QVERIFY(!h.player.metadata.has_value());
        QVERIFY(h.notifications.empty());
    }

    void testListingAppliesConfiguredZone() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z1", "Office", core::PlaybackState::Paused),
                                  zone("z2", "Kitchen", core::PlaybackState::Playing)}));

        QVERIFY(h.player.metadata.has_value());
        QCOMPARE(h.player.metadata->title, std::string("Track z2"));
        QCOMPARE(*h.player.metadata->art_url, std::string("http://10.0.0.5:9330/image/img-z2"));
        QCOMPARE(h.player.playback_status, std::string("Playing"));
        QVERIFY(h.player.can_go_next);
        QVERIFY(h.player.can_pause);
        QCOMPARE(h.player.position, std::int64_t{3'000'000});
        QCOMPARE(h.orchestrator.state().zone->zone_id, std::string("z2"));
    }

    void testOtherZonesIgnored() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z1", "Office", core::PlaybackState::Playing)}));

        QVERIFY(!h.player.metadata.has_value());
        QVERIFY(!h.orchestrator.state().zone.has_value());
        QVERIFY(h.notifications.empty());
    }

    void testNoSelectionIgnoresListing() {
        Harness h;
        h.selection.reset();
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z1", "Kitchen", core::PlaybackState::Playing)}));

        QVERIFY(!h.player.metadata.has_value());
    }

    void testPlayingZoneRequestsNotification() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));

        QCOMPARE(h.notifications.size(), std::size_t{1});
        QCOMPARE(h.notifications[0].title_parts, (std::vector<std::string>{"Band"}));
        QCOMPARE(h.notifications[0].message, std::string("Track z2"));

        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Paused)},
                                 ZonesListing::Kind::Changed));
        QCOMPARE(h.notifications.size(), std::size_t{1});
        QCOMPARE(h.player.playback_status, std::string("Paused"));
    }

    void testSeekUpdatesPosition() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));
        const int updates = h.player.metadata_updates;

        SeekChanges seeks;
        seeks.changes.push_back(SeekChange{"z1", 99.0, std::nullopt});
        seeks.changes.push_back(SeekChange{"z2", 42.25, 100.0});
        h.transport.emit(seeks);

        QCOMPARE(h.player.position, std::int64_t{42'250'000});
        QCOMPARE(h.orchestrator.current_position_us(), std::int64_t{42'250'000});
        QVERIFY(h.player.position_provider);
        QCOMPARE(h.player.position_provider(), std::int64_t{42'250'000});
        QCOMPARE(h.player.metadata_updates, updates);
    }

    void testSeekBeforeZoneTrackedIgnored() {
        Harness h;
        h.orchestrator.on_core_paired(connection());

        SeekChanges seeks;
        seeks.changes.push_back(SeekChange{"z2", 5.0, std::nullopt});
        h.transport.emit(seeks);

        QCOMPARE(h.player.position, std::int64_t{0});
        QCOMPARE(h.orchestrator.current_position_us(), std::int64_t{0});
    }

    void testUnpairingStopsUpdates() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));
        const int updates = h.player.metadata_updates;

        h.orchestrator.on_core_unpaired(connection());
        QVERIFY(!h.orchestrator.state().is_paired());

        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Paused)},
                                 ZonesListing::Kind::Changed));
        QCOMPARE(h.player.metadata_updates, updates);
        QCOMPARE(h.player.playback_status, std::string("Playing"));
        QCOMPARE(h.orchestrator.current_position_us(), std::int64_t{0});
    }

    void testSelectionChangeResubscribes() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));

        h.selection = core::ZoneSelection{"Office", ""};
        h.orchestrator.on_selection_changed();

        QCOMPARE(h.transport.subscribe_count, 2);
        QVERIFY(!h.orchestrator.state().zone.has_value());

        h.transport.emit(listing({zone("z1", "Office", core::PlaybackState::Stopped)}));
        QCOMPARE(h.orchestrator.state().zone->zone_id, std::string("z1"));
        QCOMPARE(h.player.playback_status, std::string("Stopped"));
    }

    void testSelectionChangeWhileUnpairedDoesNotSubscribe() {
        Harness h;
        h.orchestrator.on_selection_changed();
        QCOMPARE(h.transport.subscribe_count, 0);
    }

    void testCanPlayLeftAloneByDefault() {
        Harness h;
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));

        QCOMPARE(h.player.can_play_updates, 0);
        QVERIFY(h.player.can_play);
    }

    void testCanPlayMappedWhenEnabled() {
        Harness h(services::TranslatorOptions{true});
        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));

        QCOMPARE(h.player.can_play_updates, 1);
        QVERIFY(!h.player.can_play);
    }

    void testNowPlayingPublished() {
        Harness h;
        auto bus = std::make_shared<core::EventBus>();
        std::vector<std::string> statuses;
        bus->subscribe<core::events::NowPlayingChanged>([&statuses](const core::events::NowPlayingChanged& event) {
            statuses.push_back(event.zone_name + ":" + event.playback_status);
        });
        h.orchestrator.set_event_bus(bus);

        h.orchestrator.on_core_paired(connection());
        h.transport.emit(listing({zone("z2", "Kitchen", core::PlaybackState::Playing)}));

        QCOMPARE(statuses, (std::vector<std::string>{"Kitchen:Playing"}));
    }
};

QTEST_MAIN(TestSessionOrchestrator)
#include "test_session_orchestrator.moc"

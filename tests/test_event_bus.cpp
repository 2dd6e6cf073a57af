#include <QTest>
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/core/events.hpp"
#include <stdexcept>

using namespace roon_mpris::core;

class TestEventBus : public QObject {
    Q_OBJECT
private slots:
    void testPublishReachesSubscribersOfThatType() {
        EventBus bus;
        std::vector<std::string> paired;
        int unpaired = 0;

        bus.subscribe<events::CorePaired>([&paired](const events::CorePaired& event) {
            paired.push_back(event.connection.core_id);
        });
        bus.subscribe<events::CoreUnpaired>([&unpaired](const events::CoreUnpaired&) { ++unpaired; });

        bus.publish(events::CorePaired{Connection{"core-1", "Core", "2.0", "h:1"}});

        QCOMPARE(paired, (std::vector<std::string>{"core-1"}));
        QCOMPARE(unpaired, 0);
    }

    void testUnsubscribe() {
        EventBus bus;
        int calls = 0;
        auto id = bus.subscribe<events::CoreUnpaired>([&calls](const events::CoreUnpaired&) { ++calls; });
        QCOMPARE(bus.subscriber_count<events::CoreUnpaired>(), std::size_t{1});

        bus.unsubscribe(id);
        bus.unsubscribe(id);
        bus.publish(events::CoreUnpaired{Connection{}});

        QCOMPARE(calls, 0);
        QCOMPARE(bus.subscriber_count<events::CoreUnpaired>(), std::size_t{0});
    }

    void testThrowingHandlerDoesNotStopOthers() {
        EventBus bus;
        int calls = 0;
        bus.subscribe<events::CorePaired>([](const events::CorePaired&) {
            throw std::runtime_error("boom");
        });
        bus.subscribe<events::CorePaired>([&calls](const events::CorePaired&) { ++calls; });

        bus.publish(events::CorePaired{Connection{}});
        QCOMPARE(calls, 1);
    }

    void testZoneChangedDetection() {
        ApplicationConfig before;
        ApplicationConfig after = before;
        after.roon.port = 9200;
        QVERIFY(!events::ConfigurationUpdated(before, after).zone_changed());

        after.zone = ZoneSelection{"Kitchen", "out"};
        QVERIFY(events::ConfigurationUpdated(before, after).zone_changed());
    }
};

QTEST_MAIN(TestEventBus)
#include "test_event_bus.moc"

#include <QTest>
#include <QTemporaryDir>
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/services/roon/settings_provider.hpp"

using namespace roon_mpris;
using services::MooMessage;
using services::MooVerb;
using services::SettingsProvider;
using nlohmann::json;

namespace {

struct Response {
    MooVerb verb;
    std::string name;
    json body;
};

struct Recorder {
    std::vector<Response> responses;

    SettingsProvider::Reply reply() {
        return [this](MooVerb verb, const std::string& name, const json& body) {
            responses.push_back(Response{verb, name, body});
        };
    }
};

MooMessage settings_request(const std::string& method, const json& body) {
    return MooMessage::request(1, std::string(SettingsProvider::SERVICE_NAME) + "/" + method, body);
}

json kitchen_values() {
    return json{{"zone", {{"output_id", "out-1"}, {"name", "Kitchen"}}}};
}

} // namespace

class TestSettingsProvider : public QObject {
    Q_OBJECT
private slots:
    void init() {
        m_dir = std::make_unique<QTemporaryDir>();
        m_bus = std::make_shared<core::EventBus>();
        m_config = core::ConfigurationService::create(m_dir->path().toStdString(), m_bus);
        QVERIFY(m_config->load().has_value());
    }

    void cleanup() {
        m_config.reset();
        m_bus.reset();
        m_dir.reset();
    }

    void testLayoutForEmptyZone() {
        auto layout = SettingsProvider::make_layout(json{{"zone", nullptr}});

        QCOMPARE(layout["has_error"].get<bool>(), false);
        QCOMPARE(layout["layout"].size(), std::size_t{1});
        QCOMPARE(layout["layout"][0]["type"].get<std::string>(), std::string("zone"));
        QCOMPARE(layout["layout"][0]["title"].get<std::string>(), std::string("Zone"));
        QCOMPARE(layout["layout"][0]["setting"].get<std::string>(), std::string("zone"));
        QVERIFY(!layout["layout"][0].contains("error"));
    }

    void testLayoutFlagsInvalidZone() {
        auto layout = SettingsProvider::make_layout(json{{"zone", {{"output_id", "x"}}}});
        QCOMPARE(layout["has_error"].get<bool>(), true);
        QCOMPARE(layout["layout"][0]["error"].get<std::string>(), std::string("Select a zone"));

        QCOMPARE(SettingsProvider::make_layout(json{{"zone", "Kitchen"}})["has_error"].get<bool>(), true);
    }

    void testValuesFromConfig() {
        core::ApplicationConfig config;
        QVERIFY(SettingsProvider::values_from_config(config)["zone"].is_null());

        config.zone = core::ZoneSelection{"Kitchen", "out-1"};
        auto values = SettingsProvider::values_from_config(config);
        QCOMPARE(values["zone"]["name"].get<std::string>(), std::string("Kitchen"));
        QCOMPARE(values["zone"]["output_id"].get<std::string>(), std::string("out-1"));
    }

    void testZoneFromValues() {
        auto zone = SettingsProvider::zone_from_values(kitchen_values());
        QVERIFY(zone.has_value());
        QCOMPARE(*zone, (core::ZoneSelection{"Kitchen", "out-1"}));

        QVERIFY(!SettingsProvider::zone_from_values(json{{"zone", nullptr}}).has_value());
        QVERIFY(!SettingsProvider::zone_from_values(json::object()).has_value());
    }

    void testGetSettings() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder recorder;

        QVERIFY(provider.handle_request(settings_request("get_settings", json::object()), recorder.reply()));

        QCOMPARE(recorder.responses.size(), std::size_t{1});
        QCOMPARE(recorder.responses[0].verb, MooVerb::Complete);
        QCOMPARE(recorder.responses[0].name, std::string("Success"));
        QVERIFY(recorder.responses[0].body["settings"]["values"]["zone"].is_null());
    }

    void testUnknownMethod() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder recorder;

        QVERIFY(!provider.handle_request(settings_request("reset_settings", json::object()), recorder.reply()));
        QVERIFY(recorder.responses.empty());
    }

    void testDryRunDoesNotPersist() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder recorder;

        json body = {{"is_dry_run", true}, {"settings", {{"values", kitchen_values()}}}};
        QVERIFY(provider.handle_request(settings_request("save_settings", body), recorder.reply()));

        QCOMPARE(recorder.responses[0].name, std::string("Success"));
        QCOMPARE(recorder.responses[0].body["settings"]["values"], kitchen_values());
        QVERIFY(!m_config->get().zone.has_value());
    }

    void testInvalidSaveRejected() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder recorder;

        json body = {{"is_dry_run", false}, {"settings", {{"values", {{"zone", {{"name", ""}}}}}}}};
        provider.handle_request(settings_request("save_settings", body), recorder.reply());

        QCOMPARE(recorder.responses[0].verb, MooVerb::Complete);
        QCOMPARE(recorder.responses[0].name, std::string("NotValid"));
        QCOMPARE(recorder.responses[0].body["settings"]["has_error"].get<bool>(), true);
        QVERIFY(!m_config->get().zone.has_value());
    }

    void testSavePersistsAndNotifiesSubscribers() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder subscription;
        Recorder saver;

        provider.handle_request(settings_request("subscribe_settings", json{{"subscription_key", 0}}),
                                subscription.reply());
        QCOMPARE(provider.subscription_count(), std::size_t{1});
        QCOMPARE(subscription.responses[0].verb, MooVerb::Continue);
        QCOMPARE(subscription.responses[0].name, std::string("Subscribed"));

        json body = {{"is_dry_run", false}, {"settings", {{"values", kitchen_values()}}}};
        provider.handle_request(settings_request("save_settings", body), saver.reply());

        QCOMPARE(saver.responses[0].name, std::string("Success"));
        QVERIFY(m_config->get().zone.has_value());
        QCOMPARE(m_config->get().zone->name, std::string("Kitchen"));

        QCOMPARE(subscription.responses.size(), std::size_t{2});
        QCOMPARE(subscription.responses[1].verb, MooVerb::Continue);
        QCOMPARE(subscription.responses[1].name, std::string("Changed"));
        QCOMPARE(subscription.responses[1].body["settings"]["values"]["zone"]["name"].get<std::string>(),
                 std::string("Kitchen"));

        // Reloading from disk sees the saved zone
        auto reloaded = core::ConfigurationService::create(m_dir->path().toStdString());
        QVERIFY(reloaded->load().has_value());
        QCOMPARE(*reloaded->get().zone, (core::ZoneSelection{"Kitchen", "out-1"}));
    }

    void testUnsubscribe() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder recorder;

        provider.handle_request(settings_request("subscribe_settings", json{{"subscription_key", "a"}}),
                                recorder.reply());
        provider.handle_request(settings_request("unsubscribe_settings", json{{"subscription_key", "a"}}),
                                recorder.reply());

        QCOMPARE(provider.subscription_count(), std::size_t{0});
        QCOMPARE(recorder.responses.back().verb, MooVerb::Complete);
        QCOMPARE(recorder.responses.back().name, std::string("Unsubscribed"));
    }

    void testClearSubscriptionsStopsChanges() {
        SettingsProvider provider(*m_config, *m_bus);
        Recorder recorder;

        provider.handle_request(settings_request("subscribe_settings", json{{"subscription_key", 1}}),
                                recorder.reply());
        provider.clear_subscriptions();

        auto config = m_config->get();
        config.zone = core::ZoneSelection{"Office", ""};
        QVERIFY(m_config->update(config).has_value());

        QCOMPARE(recorder.responses.size(), std::size_t{1});
    }

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::shared_ptr<core::EventBus> m_bus;
    std::unique_ptr<core::ConfigurationService> m_config;
};

QTEST_MAIN(TestSettingsProvider)
#include "test_settings_provider.moc"

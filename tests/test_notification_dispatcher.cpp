#include <QTest>
#include <QTemporaryDir>
#include "fakes.hpp"
#include "roon_mpris/services/bridge/notification_dispatcher.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <thread>

using namespace roon_mpris;
using services::NotificationDispatcher;

namespace {

NotificationDispatcher::Poster inline_poster() {
    return [](NotificationDispatcher::Task task) { task(); };
}

core::NotificationConfig config_in(const QTemporaryDir& dir) {
    core::NotificationConfig config;
    config.artwork_path = dir.filePath("cover").toStdString();
    return config;
}

bool wait_for_notifications(testing::FakeNotifier& notifier, std::size_t count) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (notifier.notifications().size() >= count) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

// Holds posted tasks until the test runs them, like a busy UI event loop
class DeferredPoster {
public:
    NotificationDispatcher::Poster poster() {
        return [this](NotificationDispatcher::Task task) {
            std::lock_guard lock(m_mutex);
            m_tasks.push_back(std::move(task));
            m_cv.notify_all();
        };
    }

    bool wait_for_tasks(std::size_t count) {
        std::unique_lock lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::seconds(5), [this, count]() { return m_tasks.size() >= count; });
    }

    void run_next() {
        NotificationDispatcher::Task task;
        {
            std::lock_guard lock(m_mutex);
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<NotificationDispatcher::Task> m_tasks;
};

} // namespace

class TestNotificationDispatcher : public QObject {
    Q_OBJECT
private slots:
    void testBuildNotification() {
        core::NotificationRequest request{{"Artist One", "Artist Two"}, "Song", std::nullopt};
        auto notification = NotificationDispatcher::build_notification(request, "/tmp/cover");

        QCOMPARE(notification.title, std::string("Artist One, Artist Two"));
        QCOMPARE(notification.message, std::string("Song"));
        QCOMPARE(notification.icon_path, std::string("/tmp/cover"));
    }

    void testDownloadsArtworkThenNotifies() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), inline_poster());

        dispatcher.notify({"Band"}, "Song", std::string("http://core/image/1"));

        QVERIFY(wait_for_notifications(*notifier, 1));
        auto shown = notifier->notifications();
        QCOMPARE(shown[0].title, std::string("Band"));
        QCOMPARE(shown[0].message, std::string("Song"));
        QCOMPARE(shown[0].icon_path, dir.filePath("cover").toStdString());
        QCOMPARE(http->requests(), (std::vector<std::string>{"http://core/image/1"}));
    }

    void testFailedDownloadRemovesFile() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        http->fail_downloads = true;
        auto notifier = std::make_shared<testing::FakeNotifier>();
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), inline_poster());

        dispatcher.notify({"Band"}, "Song", std::string("http://core/image/1"));
        QVERIFY(http->wait_for_requests(1));
        dispatcher.shutdown();

        QVERIFY(notifier->notifications().empty());
        QVERIFY(!std::filesystem::exists(dir.filePath("cover").toStdString()));
    }

    void testQueuedRequestSupersededByLatest() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        http->gate_downloads = true;
        auto notifier = std::make_shared<testing::FakeNotifier>();
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), inline_poster());

        dispatcher.notify({"A"}, "First", std::string("http://core/image/1"));
        QVERIFY(http->wait_for_requests(1));

        // First is in flight; second waits and is replaced by third
        dispatcher.notify({"B"}, "Second", std::string("http://core/image/2"));
        dispatcher.notify({"C"}, "Third", std::string("http://core/image/3"));

        http->release();
        QVERIFY(http->wait_for_requests(2));
        http->release();
        QVERIFY(wait_for_notifications(*notifier, 2));
        dispatcher.shutdown();

        QCOMPARE(http->requests(), (std::vector<std::string>{"http://core/image/1", "http://core/image/3"}));
        auto shown = notifier->notifications();
        QCOMPARE(shown.size(), std::size_t{2});
        QCOMPARE(shown[0].message, std::string("First"));
        QCOMPARE(shown[1].message, std::string("Third"));
    }

    void testNextDownloadWaitsForDelivery() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        DeferredPoster deferred;
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), deferred.poster());

        dispatcher.notify({"A"}, "Track A", std::string("http://core/image/a"));
        QVERIFY(deferred.wait_for_tasks(1));

        dispatcher.notify({"B"}, "Track B", std::string("http://core/image/b"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        QCOMPARE(http->requests().size(), std::size_t{1});

        deferred.run_next();
        QVERIFY(deferred.wait_for_tasks(1));
        deferred.run_next();
        dispatcher.shutdown();

        QCOMPARE(notifier->icons(), (std::vector<std::string>{"http://core/image/a", "http://core/image/b"}));
    }

    void testTextOnlyQueuesBehindDownload() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        http->gate_downloads = true;
        auto notifier = std::make_shared<testing::FakeNotifier>();
        auto config = config_in(dir);
        config.require_artwork = false;
        NotificationDispatcher dispatcher(http, notifier, config, inline_poster());

        dispatcher.notify({"A"}, "First", std::string("http://core/image/1"));
        QVERIFY(http->wait_for_requests(1));
        dispatcher.notify({"B"}, "Second", std::nullopt);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        QVERIFY(notifier->notifications().empty());

        http->release();
        QVERIFY(wait_for_notifications(*notifier, 2));
        dispatcher.shutdown();

        auto shown = notifier->notifications();
        QCOMPARE(shown[0].message, std::string("First"));
        QCOMPARE(shown[1].message, std::string("Second"));
        QVERIFY(shown[1].icon_path.empty());
    }

    void testShutdownWhileDeliveryPending() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        DeferredPoster deferred;
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), deferred.poster());

        dispatcher.notify({"A"}, "Track A", std::string("http://core/image/a"));
        QVERIFY(deferred.wait_for_tasks(1));
        dispatcher.shutdown();

        QVERIFY(notifier->notifications().empty());
    }

    void testMissingArtworkSkippedByDefault() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), inline_poster());

        dispatcher.notify({"Band"}, "Song", std::nullopt);
        dispatcher.shutdown();

        QVERIFY(notifier->notifications().empty());
        QVERIFY(http->requests().empty());
    }

    void testMissingArtworkSentAsTextWhenAllowed() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        auto config = config_in(dir);
        config.require_artwork = false;
        NotificationDispatcher dispatcher(http, notifier, config, inline_poster());

        dispatcher.notify({"Band"}, "Song", std::nullopt);

        QVERIFY(wait_for_notifications(*notifier, 1));
        auto shown = notifier->notifications();
        QCOMPARE(shown.size(), std::size_t{1});
        QVERIFY(shown[0].icon_path.empty());
        QVERIFY(http->requests().empty());
    }

    void testDisabledDropsEverything() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        auto config = config_in(dir);
        config.enabled = false;
        NotificationDispatcher dispatcher(http, notifier, config, inline_poster());

        dispatcher.notify({"Band"}, "Song", std::string("http://core/image/1"));
        dispatcher.shutdown();

        QVERIFY(http->requests().empty());
        QVERIFY(notifier->notifications().empty());
    }

    void testSetConfigTakesEffect() {
        QTemporaryDir dir;
        auto http = std::make_shared<testing::FakeHttpClient>();
        auto notifier = std::make_shared<testing::FakeNotifier>();
        NotificationDispatcher dispatcher(http, notifier, config_in(dir), inline_poster());

        auto config = config_in(dir);
        config.enabled = false;
        dispatcher.set_config(config);
        dispatcher.notify({"Band"}, "Song", std::string("http://core/image/1"));
        dispatcher.shutdown();

        QVERIFY(http->requests().empty());
    }
};

QTEST_MAIN(TestNotificationDispatcher)
#include "test_notification_dispatcher.moc"

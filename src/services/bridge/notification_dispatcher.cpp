#include "roon_mpris/services/bridge/notification_dispatcher.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <filesystem>

namespace roon_mpris::services {

namespace {
    constexpr std::string_view COMPONENT = "NotificationDispatcher";

    // Signalled by the posted task once the notifier has shown the notification
    struct DeliveryGate {
        std::mutex mutex;
        std::condition_variable_any cv;
        bool done = false;
    };

    std::string join(const std::vector<std::string>& parts, std::string_view separator) {
        std::string result;
        for (const auto& part : parts) {
            if (!result.empty()) {
                result.append(separator);
            }
            result.append(part);
        }
        return result;
    }
}

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<HttpClient> http_client,
                                               std::shared_ptr<platform::NotificationManager> notifier,
                                               core::NotificationConfig config,
                                               Poster poster)
    : m_http_client(std::move(http_client)),
      m_notifier(std::move(notifier)),
      m_poster(std::move(poster)),
      m_config(std::move(config)) {
    m_worker = std::jthread([this](std::stop_token stop) { worker_loop(stop); });
}

NotificationDispatcher::~NotificationDispatcher() {
    shutdown();
}

void NotificationDispatcher::shutdown() {
    if (m_worker.joinable()) {
        m_worker.request_stop();
        m_cv.notify_all();
        m_worker.join();
    }
}

void NotificationDispatcher::set_config(core::NotificationConfig config) {
    std::lock_guard lock(m_mutex);
    m_config = std::move(config);
}

void NotificationDispatcher::notify(std::vector<std::string> title_parts,
                                    std::string message,
                                    std::optional<std::string> artwork_url) {
    notify(core::NotificationRequest{std::move(title_parts), std::move(message), std::move(artwork_url)});
}

void NotificationDispatcher::notify(const core::NotificationRequest& request) {
    std::unique_lock lock(m_mutex);
    if (!m_config.enabled) {
        return;
    }

    if (!request.artwork_url && m_config.require_artwork) {
        LOG_DEBUG(COMPONENT, "No artwork for '" + request.message + "', skipping notification");
        return;
    }

    if (m_pending) {
        LOG_DEBUG(COMPONENT, "Superseding queued notification '" + m_pending->message + "'");
    }
    m_pending = request;
    lock.unlock();
    m_cv.notify_one();
}

platform::Notification NotificationDispatcher::build_notification(const core::NotificationRequest& request,
                                                                  const std::string& icon_path) {
    return platform::Notification(join(request.title_parts, ", "), request.message, icon_path);
}

void NotificationDispatcher::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        core::NotificationRequest request;
        std::string artwork_path;
        {
            std::unique_lock lock(m_mutex);
            if (!m_cv.wait(lock, stop, [this]() { return m_pending.has_value(); })) {
                return;
            }
            request = std::move(*m_pending);
            m_pending.reset();
            artwork_path = m_config.artwork_path;
        }

        try {
            process(request, artwork_path, stop);
        } catch (const std::exception& e) {
            LOG_ERROR(COMPONENT, "Notification for '" + request.message + "' failed: " + e.what());
        }
    }
}

void NotificationDispatcher::process(const core::NotificationRequest& request,
                                     const std::string& artwork_path,
                                     std::stop_token stop) {
    if (!request.artwork_url) {
        deliver(build_notification(request, {}), stop);
        return;
    }

    auto result = m_http_client->download_file(*request.artwork_url, artwork_path);
    if (!result) {
        std::error_code ec;
        std::filesystem::remove(artwork_path, ec);
        LOG_WARNING(COMPONENT, "Artwork download from " + *request.artwork_url + " failed: " +
                    to_string(result.error()));
        return;
    }

    deliver(build_notification(request, artwork_path), stop);
}

void NotificationDispatcher::deliver(platform::Notification notification, std::stop_token stop) {
    auto notifier = m_notifier;
    if (!notifier) {
        return;
    }

    auto gate = std::make_shared<DeliveryGate>();
    m_poster([notifier, gate, notification = std::move(notification)]() {
        auto shown = notifier->show_notification(notification);
        if (!shown) {
            LOG_WARNING("NotificationDispatcher", "Desktop notification failed: " +
                        platform::to_string(shown.error()));
        }
        {
            std::lock_guard lock(gate->mutex);
            gate->done = true;
        }
        gate->cv.notify_all();
    });

    // The next download overwrites the artwork file, so hold the worker until
    // the notifier has loaded it
    std::unique_lock lock(gate->mutex);
    if (!gate->cv.wait(lock, stop, [&gate]() { return gate->done; })) {
        LOG_DEBUG(COMPONENT, "Stopped before notification was delivered");
    }
}

} // namespace roon_mpris::services

#pragma once

#include "roon_mpris/core/models.hpp"
#include "roon_mpris/platform/ui_service.hpp"
#include "roon_mpris/services/network/http_client.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace roon_mpris::services {

/**
 * @brief Track-change notifications with downloaded cover art
 *
 * notify() never blocks. One worker thread downloads artwork to the
 * configured scratch path and hands the finished notification to the poster,
 * which delivers it on the UI thread. The worker takes the next request only
 * after the previous notification has been shown, so deliveries stay in
 * order and never see a later download's artwork. A request still waiting
 * when a newer one arrives is dropped in its favour; text-only requests queue
 * the same way.
 */
class NotificationDispatcher {
public:
    using Task = std::function<void()>;
    using Poster = std::function<void(Task)>;

    NotificationDispatcher(std::shared_ptr<HttpClient> http_client,
                           std::shared_ptr<platform::NotificationManager> notifier,
                           core::NotificationConfig config,
                           Poster poster);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void notify(std::vector<std::string> title_parts,
                std::string message,
                std::optional<std::string> artwork_url);
    void notify(const core::NotificationRequest& request);

    void set_config(core::NotificationConfig config);

    // Stops the worker; a download in progress is allowed to finish
    void shutdown();

    // Artists end up in the title and the track name in the body
    static platform::Notification build_notification(const core::NotificationRequest& request,
                                                     const std::string& icon_path);

private:
    void worker_loop(std::stop_token stop);
    void process(const core::NotificationRequest& request,
                 const std::string& artwork_path,
                 std::stop_token stop);
    void deliver(platform::Notification notification, std::stop_token stop);

    std::shared_ptr<HttpClient> m_http_client;
    std::shared_ptr<platform::NotificationManager> m_notifier;
    Poster m_poster;

    std::mutex m_mutex;
    std::condition_variable_any m_cv;
    core::NotificationConfig m_config;
    std::optional<core::NotificationRequest> m_pending;
    std::jthread m_worker;
};

} // namespace roon_mpris::services

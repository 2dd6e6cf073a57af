#include "roon_mpris/core/application.hpp"
#include "roon_mpris/core/configuration_service.hpp"
#include "roon_mpris/core/event_bus.hpp"
#include "roon_mpris/core/events.hpp"
#include "roon_mpris/platform/mpris/mpris_player.hpp"
#include "roon_mpris/platform/qt/qt_settings_dialog.hpp"
#include "roon_mpris/platform/ui_service.hpp"
#include "roon_mpris/services/bridge/command_relay.hpp"
#include "roon_mpris/services/bridge/notification_dispatcher.hpp"
#include "roon_mpris/services/bridge/session_orchestrator.hpp"
#include "roon_mpris/services/network/http_client.hpp"
#include "roon_mpris/services/roon/pairing_store.hpp"
#include "roon_mpris/services/roon/roon_client.hpp"
#include "roon_mpris/services/roon/settings_provider.hpp"
#include "roon_mpris/utils/logger.hpp"
#include "version.h"

#include <QCoreApplication>
#include <QDialog>
#include <QMetaObject>
#include <atomic>
#include <vector>

namespace roon_mpris {
namespace core {

ApplicationConfig ApplicationOptions::apply_to(ApplicationConfig config) const {
    if (host) config.roon.host = *host;
    if (port) config.roon.port = *port;
    if (log_traffic) config.roon.log_traffic = *log_traffic;
    if (log_level) config.log_level = *log_level;
    return config;
}

class ApplicationImpl : public Application {
public:
    explicit ApplicationImpl(ApplicationOptions options)
        : m_options(std::move(options)),
          m_state(ApplicationState::NotInitialized),
          m_running(false),
          m_shutdown_requested(false),
          m_event_bus(std::make_shared<EventBus>()) {
        LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        if (m_running) {
            stop();
        }
        if (m_state != ApplicationState::Stopped && m_state != ApplicationState::NotInitialized) {
            shutdown();
        }
        LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        LOG_INFO("Application", "Initializing...");

        if (m_state != ApplicationState::NotInitialized) {
            LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_state = ApplicationState::Initializing;

        try {
            if (!initialize_configuration()) {
                return std::unexpected(ApplicationError::ConfigurationError);
            }

            initialize_ui_service();
            initialize_notifications();
            initialize_media_player();
            initialize_roon();
            connect_services();

            m_state = ApplicationState::Running;
            LOG_INFO("Application", "Initialization complete");
            return {};

        } catch (const std::exception& e) {
            LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start() override {
        LOG_INFO("Application", "Starting services...");

        if (m_state != ApplicationState::Running) {
            LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::InitializationFailed);
        }

        try {
            m_running = true;
            m_shutdown_requested = false;

            show_system_tray();

            const auto config = effective_config();
            m_roon_client->start(config.roon.host, config.roon.port);

            LOG_INFO("Application", "Services started");
            return {};

        } catch (const std::exception& e) {
            LOG_ERROR("Application", "Start failed: " + std::string(e.what()));
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    void stop() override {
        LOG_INFO("Application", "Stopping...");
        m_state = ApplicationState::Stopping;
        m_running = false;
        m_shutdown_requested = true;

        if (m_roon_client) {
            m_roon_client->stop();
        }
    }

    void shutdown() override {
        LOG_INFO("Application", "Shutting down...");

        cleanup_event_subscriptions();
        stop_services();

        m_state = ApplicationState::Stopped;
        LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    bool is_running() const override {
        return m_running && !m_shutdown_requested;
    }

    void quit() override {
        LOG_INFO("Application", "Quitting");
        m_shutdown_requested = true;
        QCoreApplication::quit();
    }

    std::expected<ApplicationConfig, ApplicationError> get_config() const override {
        if (!m_config_service) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return effective_config();
    }

    std::expected<std::reference_wrapper<EventBus>, ApplicationError> get_event_bus() override {
        if (!m_event_bus) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return std::ref(*m_event_bus);
    }

private:
    ApplicationConfig effective_config() const {
        return m_options.apply_to(m_config_service->get());
    }

    bool initialize_configuration() {
        m_config_service = ConfigurationService::create(m_options.config_directory, m_event_bus);
        if (!m_config_service) {
            LOG_ERROR("Application", "Failed to create configuration service");
            m_state = ApplicationState::Error;
            return false;
        }

        if (auto loaded = m_config_service->load(); !loaded) {
            LOG_WARNING("Application", "Using default configuration: " + to_string(loaded.error()));
        }

        m_pairing_store = std::make_unique<services::PairingStore>(
            m_config_service->config_path().parent_path() / "roonstate.yaml");
        return true;
    }

    void initialize_ui_service() {
        m_ui_service = platform::UiService::create_default();
        if (!m_ui_service) {
            LOG_WARNING("Application", "UI not supported on this platform");
            return;
        }

        if (auto result = m_ui_service->initialize(); !result) {
            LOG_WARNING("Application", "UI initialization failed: " + platform::to_string(result.error()));
            m_ui_service.reset();
            return;
        }

        if (m_ui_service->supports_system_tray()) {
            m_system_tray = m_ui_service->create_system_tray();
            if (m_system_tray) {
                if (auto result = m_system_tray->initialize(); !result) {
                    LOG_WARNING("Application", "System tray initialization failed");
                    m_system_tray.reset();
                }
            }
        }

        LOG_INFO("Application", "UI service initialized");
    }

    void initialize_notifications() {
        if (m_ui_service) {
            auto manager = m_ui_service->create_notification_manager(m_system_tray.get());
            if (manager) {
                if (auto result = manager->initialize(); result) {
                    m_notification_manager = std::move(manager);
                } else {
                    LOG_WARNING("Application", "Notifications unavailable: " + platform::to_string(result.error()));
                }
            }
        }

        services::HttpClientConfig http_config;
        http_config.user_agent = std::string("roon-mpris/") + ROON_MPRIS_VERSION_STRING;
        m_http_client = services::create_http_client(http_config);

        m_dispatcher = std::make_unique<services::NotificationDispatcher>(
            m_http_client,
            m_notification_manager,
            effective_config().notifications,
            [](services::NotificationDispatcher::Task task) {
                if (auto* app = QCoreApplication::instance()) {
                    QMetaObject::invokeMethod(app, std::move(task), Qt::QueuedConnection);
                }
            });
    }

    void initialize_media_player() {
        const auto config = effective_config();

        platform::mpris::MprisOptions options;
        options.bus_name = config.mpris.bus_name;
        options.identity = config.mpris.identity;

        m_player = std::make_unique<platform::mpris::MprisPlayer>(options);
        if (auto result = m_player->initialize(); !result) {
            LOG_ERROR("Application", "MPRIS player unavailable: " + platform::to_string(result.error()));
        }
    }

    void initialize_roon() {
        const auto config = effective_config();

        m_settings_provider = std::make_unique<services::SettingsProvider>(*m_config_service, *m_event_bus);

        services::ExtensionInfo extension;
        extension.display_version = ROON_MPRIS_VERSION_STRING;
        m_roon_client = std::make_unique<services::RoonClient>(
            extension, *m_pairing_store, m_settings_provider.get());
        m_roon_client->set_log_traffic(config.roon.log_traffic);

        auto selection = [this]() { return m_config_service->get().zone; };

        services::TranslatorOptions translator_options;
        translator_options.map_can_play = config.mpris.map_can_play;

        m_orchestrator = std::make_unique<services::SessionOrchestrator>(
            *m_roon_client,
            *m_player,
            selection,
            [this](const NotificationRequest& request) { m_dispatcher->notify(request); },
            services::ZoneTranslator(translator_options));
        m_orchestrator->set_event_bus(m_event_bus);

        m_relay = std::make_unique<services::CommandRelay>(
            *m_roon_client, m_orchestrator->state(), selection, [this]() { quit(); });
    }

    void connect_services() {
        m_player->set_command_callback([this](platform::PlayerCommand command) {
            m_relay->dispatch(command);
        });
        m_player->set_event_callback([this](platform::PlayerEvent event, const std::string& detail) {
            m_relay->handle_event(event, detail);
        });

        m_roon_client->set_paired_callback([this](const Connection& connection) {
            m_orchestrator->on_core_paired(connection);
            m_event_bus->publish(events::CorePaired{connection});
        });
        m_roon_client->set_unpaired_callback([this](const Connection& connection) {
            m_orchestrator->on_core_unpaired(connection);
            m_event_bus->publish(events::CoreUnpaired{connection});
        });
        m_roon_client->set_status_callback([this](services::ClientStatus status) {
            update_status(status);
        });

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::ConfigurationUpdated>(
            [this](const events::ConfigurationUpdated& event) {
                on_configuration_updated(event);
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::CorePaired>(
            [this](const events::CorePaired& event) {
                m_core_name = event.connection.display_name;
                update_tooltip();
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::CoreUnpaired>(
            [this](const events::CoreUnpaired&) {
                m_core_name.clear();
                m_now_playing.clear();
                update_tooltip();
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::NowPlayingChanged>(
            [this](const events::NowPlayingChanged& event) {
                m_now_playing = event.zone_name + ": " + event.playback_status;
                if (event.metadata && !event.metadata->title.empty()) {
                    m_now_playing += " - " + event.metadata->title;
                }
                update_tooltip();
            }));

        LOG_INFO("Application", "Services connected");
    }

    void on_configuration_updated(const events::ConfigurationUpdated& event) {
        LOG_INFO("Application", "Configuration updated");

        const auto previous = m_options.apply_to(event.previous_config);
        const auto current = m_options.apply_to(event.new_config);

        if (previous.log_level != current.log_level) {
            utils::LoggerManager::get_instance().set_level(current.log_level);
            LOG_INFO("Application", "Log level set to " + utils::to_string(current.log_level));
        }

        m_dispatcher->set_config(current.notifications);

        services::TranslatorOptions translator_options;
        translator_options.map_can_play = current.mpris.map_can_play;
        m_orchestrator->set_translator_options(translator_options);

        m_roon_client->set_log_traffic(current.roon.log_traffic);

        if (previous.mpris.bus_name != current.mpris.bus_name || previous.mpris.identity != current.mpris.identity) {
            LOG_INFO("Application", "Media player name changes apply after restart");
        }

        if (previous.roon.host != current.roon.host || previous.roon.port != current.roon.port) {
            LOG_INFO("Application", "Core address changed, reconnecting");
            m_roon_client->stop();
            if (m_running) {
                m_roon_client->start(current.roon.host, current.roon.port);
            }
        } else if (event.zone_changed()) {
            LOG_INFO("Application", "Zone changed to " + (current.zone ? current.zone->name : std::string("none")));
            m_orchestrator->on_selection_changed();
        }
    }

    void stop_services() {
        m_roon_client.reset();
        m_relay.reset();
        m_orchestrator.reset();
        m_settings_provider.reset();

        if (m_dispatcher) {
            m_dispatcher->shutdown();
            m_dispatcher.reset();
            LOG_INFO("Application", "Notification dispatcher stopped");
        }

        if (m_player) {
            m_player->shutdown();
            m_player.reset();
            LOG_INFO("Application", "MPRIS player stopped");
        }

        if (m_notification_manager) {
            m_notification_manager->shutdown();
            m_notification_manager.reset();
        }

        if (m_system_tray) {
            m_system_tray->hide();
            m_system_tray->shutdown();
            m_system_tray.reset();
            LOG_INFO("Application", "System tray stopped");
        }

        if (m_ui_service) {
            m_ui_service->shutdown();
            LOG_INFO("Application", "UI service stopped");
        }
    }

    void cleanup_event_subscriptions() {
        if (!m_event_bus) return;

        for (auto id : m_event_subscriptions) {
            m_event_bus->unsubscribe(id);
        }
        m_event_subscriptions.clear();
    }

    void show_system_tray() {
        if (!m_system_tray) {
            return;
        }

        setup_tray_menu();
        update_tooltip();
        m_system_tray->show();
        LOG_INFO("Application", "System tray created");
    }

    void show_settings_dialog() {
        if (!m_config_service) {
            LOG_ERROR("Application", "Config service not available");
            return;
        }

        const auto current_config = m_config_service->get();

        auto* dialog = new platform::qt::QtSettingsDialog(
            current_config, m_config_service->config_path().parent_path());
        int result = dialog->exec();

        if (result == QDialog::Accepted) {
            auto new_config = dialog->get_config();

            auto update_result = m_config_service->update(new_config);
            if (update_result) {
                LOG_INFO("Application", "Configuration updated successfully");
            } else {
                LOG_ERROR("Application", "Failed to update configuration: " + to_string(update_result.error()));
            }
        }

        dialog->deleteLater();
    }

    void setup_tray_menu() {
        if (!m_system_tray) return;

        std::vector<platform::MenuItem> menu_items;

        platform::MenuItem status_item;
        status_item.id = "status";
        status_item.label = "Status: " + services::to_string(m_roon_client->status());
        status_item.enabled = false;
        menu_items.push_back(status_item);

        menu_items.push_back(platform::MenuItem::separator());

        menu_items.emplace_back("settings", "Settings...", [this]() {
            LOG_INFO("Application", "Opening settings dialog");
            show_settings_dialog();
        });

        menu_items.emplace_back("reconnect", "Reconnect", [this]() {
            LOG_INFO("Application", "Reconnect from tray");
            m_roon_client->reconnect();
        });

        menu_items.push_back(platform::MenuItem::separator());

        menu_items.emplace_back("exit", "Exit", [this]() {
            LOG_INFO("Application", "Exit from tray");
            quit();
        });

        if (!m_system_tray->set_menu(menu_items)) {
            LOG_WARNING("Application", "Tray menu setup failed");
        }
    }

    void update_status(services::ClientStatus status) {
        if (m_system_tray) {
            if (!m_system_tray->set_menu_item_label("status", "Status: " + services::to_string(status))) {
                LOG_DEBUG("Application", "Tray status item not available");
            }
        }
        update_tooltip();
    }

    void update_tooltip() {
        if (!m_system_tray) return;

        std::string tooltip = "Roon MPRIS";
        if (!m_core_name.empty()) {
            tooltip += " - " + m_core_name;
        } else if (m_roon_client) {
            tooltip += " - " + services::to_string(m_roon_client->status());
        }
        if (!m_now_playing.empty()) {
            tooltip += "\n" + m_now_playing;
        }
        (void)m_system_tray->set_tooltip(tooltip);
    }

    ApplicationOptions m_options;

    std::atomic<ApplicationState> m_state;
    std::atomic<bool> m_running;
    std::atomic<bool> m_shutdown_requested;

    std::shared_ptr<EventBus> m_event_bus;
    std::unique_ptr<ConfigurationService> m_config_service;
    std::unique_ptr<services::PairingStore> m_pairing_store;
    std::unique_ptr<platform::UiService> m_ui_service;
    std::unique_ptr<platform::SystemTray> m_system_tray;
    std::shared_ptr<platform::NotificationManager> m_notification_manager;
    std::shared_ptr<services::HttpClient> m_http_client;
    std::unique_ptr<services::NotificationDispatcher> m_dispatcher;
    std::unique_ptr<platform::mpris::MprisPlayer> m_player;
    std::unique_ptr<services::SettingsProvider> m_settings_provider;
    std::unique_ptr<services::RoonClient> m_roon_client;
    std::unique_ptr<services::SessionOrchestrator> m_orchestrator;
    std::unique_ptr<services::CommandRelay> m_relay;
    std::vector<EventBus::HandlerId> m_event_subscriptions;

    std::string m_core_name;
    std::string m_now_playing;
};

std::expected<std::unique_ptr<Application>, ApplicationError> create_application(ApplicationOptions options) {
    LOG_INFO("ApplicationFactory", "Creating application");

    try {
        return std::make_unique<ApplicationImpl>(std::move(options));
    } catch (const std::exception& e) {
        LOG_ERROR("ApplicationFactory", "Creation failed: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace roon_mpris

#include "roon_mpris/services/roon/roon_client.hpp"
#include "roon_mpris/services/roon/pairing_store.hpp"
#include "roon_mpris/services/roon/settings_provider.hpp"
#include "roon_mpris/services/roon/zone_event.hpp"
#include "roon_mpris/utils/json_helper.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <QTimer>
#include <QUrl>
#include <QWebSocket>
#include <algorithm>
#include <cmath>

namespace roon_mpris::services {

using utils::JsonHelper;

namespace {
    constexpr std::string_view COMPONENT = "RoonClient";

    std::string service_method(std::string_view service, std::string_view method) {
        return std::string(service) + "/" + std::string(method);
    }
}

std::chrono::seconds ConnectionRetryConfig::delay_for(int consecutive_failures) const {
    double delay = static_cast<double>(initial_delay.count()) *
                   std::pow(backoff_multiplier, std::max(consecutive_failures, 0));
    if (delay >= static_cast<double>(max_delay.count())) {
        return max_delay;
    }
    return std::max(std::chrono::seconds(static_cast<long>(delay)), initial_delay);
}

std::string to_string(ClientStatus status) {
    switch (status) {
        case ClientStatus::Stopped: return "Stopped";
        case ClientStatus::Discovering: return "Searching for Roon core";
        case ClientStatus::Connecting: return "Connecting";
        case ClientStatus::AwaitingAuthorization: return "Waiting for authorization in Roon";
        case ClientStatus::Paired: return "Paired";
        default: return "Unknown";
    }
}

RoonClient::RoonClient(ExtensionInfo extension, PairingStore& pairing_store, SettingsProvider* settings_provider,
                       ConnectionRetryConfig retry_config)
    : m_extension(std::move(extension)),
      m_pairing_store(pairing_store),
      m_settings_provider(settings_provider),
      m_retry_config(retry_config),
      m_reconnect_timer(std::make_unique<QTimer>()) {
    m_reconnect_timer->setSingleShot(true);
    QObject::connect(m_reconnect_timer.get(), &QTimer::timeout, [this]() { attempt_reconnect(); });

    m_discovery.set_core_found_callback([this](const sood::CoreEndpoint& endpoint) {
        m_discovery.stop();
        connect_to(endpoint.host, endpoint.http_port);
    });
}

RoonClient::~RoonClient() {
    m_on_paired = nullptr;
    m_on_unpaired = nullptr;
    m_on_status = nullptr;
    m_zone_callback = nullptr;

    if (m_socket) {
        QObject::disconnect(m_socket.get(), nullptr, nullptr, nullptr);
        m_socket->abort();
        m_socket.reset();
    }
    stop();
}

void RoonClient::set_paired_callback(PairingCallback callback) {
    m_on_paired = std::move(callback);
}

void RoonClient::set_unpaired_callback(PairingCallback callback) {
    m_on_unpaired = std::move(callback);
}

void RoonClient::set_status_callback(StatusCallback callback) {
    m_on_status = std::move(callback);
}

void RoonClient::start(const std::string& host, int port) {
    m_configured_host = host;
    m_configured_port = port;
    m_running = true;
    m_consecutive_failures = 0;

    if (host.empty()) {
        LOG_INFO(COMPONENT, "No core address configured, using discovery");
    } else {
        LOG_INFO(COMPONENT, "Connecting to core at ws://" + host + ":" + std::to_string(port));
    }
    attempt_reconnect();
}

void RoonClient::stop() {
    m_running = false;
    m_reconnect_timer->stop();
    m_discovery.stop();
    close_socket();
    set_status(ClientStatus::Stopped);
}

void RoonClient::reconnect() {
    if (!m_running) {
        return;
    }

    LOG_INFO(COMPONENT, "Reconnecting");
    m_reconnect_timer->stop();
    m_consecutive_failures = 0;
    close_socket();
    attempt_reconnect();
}

void RoonClient::attempt_reconnect() {
    if (!m_running) {
        return;
    }

    if (!m_configured_host.empty()) {
        connect_to(m_configured_host, m_configured_port);
        return;
    }

    set_status(ClientStatus::Discovering);
    if (!m_discovery.start()) {
        schedule_reconnect();
    }
}

void RoonClient::schedule_reconnect() {
    auto delay = m_retry_config.delay_for(m_consecutive_failures);
    ++m_consecutive_failures;

    LOG_INFO(COMPONENT, "Retrying in " + std::to_string(delay.count()) + "s");
    m_reconnect_timer->start(std::chrono::duration_cast<std::chrono::milliseconds>(delay));
}

void RoonClient::connect_to(const std::string& host, int port) {
    close_socket();

    m_host = host;
    m_port = port;
    m_socket = std::make_unique<QWebSocket>();

    QWebSocket* socket = m_socket.get();
    QObject::connect(socket, &QWebSocket::connected, socket, [this]() { on_connected(); });
    QObject::connect(socket, &QWebSocket::disconnected, socket, [this]() { on_disconnected(); });
    QObject::connect(socket, &QWebSocket::binaryMessageReceived, socket,
                     [this](const QByteArray& frame) { on_frame(frame); });
    QObject::connect(socket, &QWebSocket::textMessageReceived, socket,
                     [this](const QString& frame) { on_frame(frame.toUtf8()); });
    QObject::connect(socket, &QWebSocket::errorOccurred, socket, [this, socket](QAbstractSocket::SocketError) {
        LOG_WARNING(COMPONENT, "Socket error: " + socket->errorString().toStdString());
    });

    set_status(ClientStatus::Connecting);
    const std::string url = "ws://" + host + ":" + std::to_string(port) + "/api";
    LOG_DEBUG(COMPONENT, "Opening " + url);
    socket->open(QUrl(QString::fromStdString(url)));
}

void RoonClient::close_socket() {
    if (m_socket) {
        QObject::disconnect(m_socket.get(), nullptr, nullptr, nullptr);
        m_socket->abort();
        // May be running inside one of the socket's own signals
        m_socket.release()->deleteLater();
    }
    reset_session();
}

void RoonClient::reset_session() {
    m_pending.clear();
    m_zone_request_id.reset();
    if (m_settings_provider) {
        m_settings_provider->clear_subscriptions();
    }

    if (m_connection) {
        auto lost = std::move(*m_connection);
        m_connection.reset();
        LOG_WARNING(COMPONENT, "Lost core " + lost.display_name);
        if (m_on_unpaired) {
            m_on_unpaired(lost);
        }
    }
}

void RoonClient::on_connected() {
    LOG_INFO(COMPONENT, "Connected to " + m_host + ":" + std::to_string(m_port));
    request_info();
}

void RoonClient::on_disconnected() {
    LOG_INFO(COMPONENT, "Disconnected from " + m_host + ":" + std::to_string(m_port));
    close_socket();
    if (m_running) {
        set_status(m_configured_host.empty() ? ClientStatus::Discovering : ClientStatus::Connecting);
        schedule_reconnect();
    }
}

void RoonClient::on_frame(const QByteArray& frame) {
    std::string_view data(frame.constData(), static_cast<std::size_t>(frame.size()));
    if (m_log_traffic) {
        LOG_INFO(COMPONENT, "<- " + std::string(data));
    }

    auto message = parse_moo_message(data);
    if (!message) {
        LOG_ERROR(COMPONENT, "Dropping unparseable frame: " + core::to_string(message.error()));
        return;
    }

    try {
        if (message->verb == MooVerb::Request) {
            handle_request(*message);
        } else {
            handle_response(*message);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(COMPONENT, "Error handling " + message->name + ": " + e.what());
    }
}

std::uint64_t RoonClient::send_request(const std::string& name, const std::optional<nlohmann::json>& body,
                                       ResponseHandler handler) {
    std::uint64_t request_id = m_next_request_id++;
    if (handler) {
        m_pending[request_id] = std::move(handler);
    }
    send(MooMessage::request(request_id, name, body));
    return request_id;
}

void RoonClient::send_response(MooVerb verb, std::uint64_t request_id, const std::string& name,
                               const std::optional<nlohmann::json>& body) {
    send(MooMessage::response(verb, request_id, name, body));
}

void RoonClient::send(const MooMessage& message) {
    if (!m_socket || m_socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(COMPONENT, "Not connected, dropping " + message.name);
        return;
    }

    const std::string frame = serialize_moo_message(message);
    if (m_log_traffic) {
        LOG_INFO(COMPONENT, "-> " + frame);
    }
    m_socket->sendBinaryMessage(QByteArray(frame.data(), static_cast<qsizetype>(frame.size())));
}

void RoonClient::handle_request(const MooMessage& request) {
    const std::string service = request.service();
    const std::uint64_t request_id = request.request_id;

    if (service == PING_SERVICE && request.method() == "ping") {
        send_response(MooVerb::Complete, request_id, "Success", std::nullopt);
        return;
    }

    if (service == SettingsProvider::SERVICE_NAME && m_settings_provider) {
        bool handled = m_settings_provider->handle_request(request,
            [this, request_id](MooVerb verb, const std::string& name, const nlohmann::json& body) {
                send_response(verb, request_id, name, body);
            });
        if (handled) {
            return;
        }
    }

    LOG_WARNING(COMPONENT, "Unsupported request " + request.name);
    send_response(MooVerb::Complete, request_id, "InvalidRequest",
                  nlohmann::json{{"error", "unknown request: " + request.name}});
}

void RoonClient::handle_response(const MooMessage& response) {
    auto it = m_pending.find(response.request_id);
    if (it == m_pending.end()) {
        LOG_DEBUG(COMPONENT, "Response " + response.name + " for unknown request " +
                  std::to_string(response.request_id));
        return;
    }

    ResponseHandler handler = it->second;
    if (response.verb == MooVerb::Complete) {
        m_pending.erase(it);
    }
    handler(response);
}

void RoonClient::request_info() {
    send_request(service_method(REGISTRY_SERVICE, "info"), std::nullopt, [this](const MooMessage& response) {
        auto body = response.json_body();
        if (response.name != "Success" || !body) {
            LOG_ERROR(COMPONENT, "Registry info failed: " + response.name);
            return;
        }
        register_extension(*body);
    });
}

void RoonClient::register_extension(const nlohmann::json& info) {
    const auto core_id = JsonHelper::get_optional<std::string>(info, "core_id", "");
    LOG_INFO(COMPONENT, "Core " + JsonHelper::get_optional<std::string>(info, "display_name", "?") + " (" +
             JsonHelper::get_optional<std::string>(info, "display_version", "?") + ") answered");

    nlohmann::json request = {
        {"extension_id", m_extension.extension_id},
        {"display_name", m_extension.display_name},
        {"display_version", m_extension.display_version},
        {"publisher", m_extension.publisher},
        {"email", m_extension.email},
        {"website", m_extension.website},
        {"required_services", nlohmann::json::array({std::string(TRANSPORT_SERVICE)})},
        {"optional_services", nlohmann::json::array()},
        {"provided_services", nlohmann::json::array({std::string(SettingsProvider::SERVICE_NAME), std::string(PING_SERVICE)})}
    };
    if (auto token = m_pairing_store.get_token(core_id)) {
        request["token"] = *token;
    }

    set_status(ClientStatus::AwaitingAuthorization);
    send_request(service_method(REGISTRY_SERVICE, "register"), request, [this](const MooMessage& response) {
        if (response.name != "Registered") {
            LOG_ERROR(COMPONENT, "Registration failed: " + response.name);
            return;
        }
        auto body = response.json_body();
        if (!body) {
            LOG_ERROR(COMPONENT, "Bad registration body: " + body.error());
            return;
        }
        on_registered(*body);
    });
}

void RoonClient::on_registered(const nlohmann::json& body) {
    core::Connection connection;
    connection.core_id = JsonHelper::get_optional<std::string>(body, "core_id", "");
    connection.display_name = JsonHelper::get_optional<std::string>(body, "display_name", "");
    connection.display_version = JsonHelper::get_optional<std::string>(body, "display_version", "");
    connection.base_address = m_host + ":" + std::to_string(m_port);

    if (auto token = JsonHelper::get_if_present<std::string>(body, "token")) {
        m_pairing_store.set_token(connection.core_id, *token);
    }
    m_pairing_store.set_paired_core_id(connection.core_id);

    m_consecutive_failures = 0;
    m_connection = connection;
    set_status(ClientStatus::Paired);

    if (m_on_paired) {
        m_on_paired(connection);
    }
}

void RoonClient::subscribe_zones(ZoneEventCallback callback) {
    m_zone_callback = std::move(callback);
    if (!m_connection) {
        LOG_WARNING(COMPONENT, "Cannot subscribe to zones while unpaired");
        return;
    }

    if (m_zone_request_id) {
        m_pending.erase(*m_zone_request_id);
        send_request(service_method(TRANSPORT_SERVICE, "unsubscribe_zones"),
                     nlohmann::json{{"subscription_key", m_zone_subscription_key}}, nullptr);
    }

    m_zone_subscription_key = m_next_subscription_key++;
    m_zone_request_id = send_request(service_method(TRANSPORT_SERVICE, "subscribe_zones"),
                                     nlohmann::json{{"subscription_key", m_zone_subscription_key}},
                                     [this](const MooMessage& message) { on_zone_message(message); });
}

void RoonClient::on_zone_message(const MooMessage& message) {
    if (message.verb == MooVerb::Complete) {
        LOG_WARNING(COMPONENT, "Zone subscription ended: " + message.name);
        m_zone_request_id.reset();
        return;
    }

    auto body = message.json_body();
    if (!body) {
        LOG_ERROR(COMPONENT, "Bad zone message body: " + body.error());
        return;
    }

    for (const auto& event : decode_zone_events(message.name, *body)) {
        if (m_zone_callback) {
            m_zone_callback(event);
        }
    }
}

void RoonClient::control(const std::string& zone_or_output_id, std::string_view command) {
    if (!m_connection) {
        LOG_WARNING(COMPONENT, "Cannot send " + std::string(command) + " while unpaired");
        return;
    }

    const std::string name(command);
    send_request(service_method(TRANSPORT_SERVICE, "control"),
                 nlohmann::json{{"zone_or_output_id", zone_or_output_id}, {"control", name}},
                 [name](const MooMessage& response) {
                     if (response.name != "Success") {
                         LOG_WARNING(COMPONENT, "Control " + name + " failed: " + response.name);
                     }
                 });
}

void RoonClient::set_status(ClientStatus status) {
    if (m_status == status) {
        return;
    }
    m_status = status;
    LOG_DEBUG(COMPONENT, "Status: " + to_string(status));
    if (m_on_status) {
        m_on_status(status);
    }
}

} // namespace roon_mpris::services

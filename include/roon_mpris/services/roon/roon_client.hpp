#pragma once

#include "roon_mpris/core/models.hpp"
#include "roon_mpris/services/roon/moo_message.hpp"
#include "roon_mpris/services/roon/sood_discovery.hpp"
#include "roon_mpris/services/roon/transport_client.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

class QTimer;
class QWebSocket;

namespace roon_mpris::services {

class PairingStore;
class SettingsProvider;

/**
 * @brief Configuration for reconnect backoff
 */
struct ConnectionRetryConfig {
    // Initial retry delay
    std::chrono::seconds initial_delay{1};

    // Maximum retry delay (backoff cap)
    std::chrono::seconds max_delay{60};

    // Backoff multiplier
    double backoff_multiplier = 2.0;

    // Delay before the attempt following `consecutive_failures` failures
    std::chrono::seconds delay_for(int consecutive_failures) const;
};

// What we tell the core about ourselves at registration
struct ExtensionInfo {
    std::string extension_id = "com.8bitcloud.roon-mpris";
    std::string display_name = "MPRIS adapter";
    std::string display_version;
    std::string publisher = "Bruce Cooper";
    std::string email = "bruce@brucecooper.net";
    std::string website = "https://github.com/brucejcooper/roon-mpris";
};

enum class ClientStatus {
    Stopped,
    Discovering,
    Connecting,
    AwaitingAuthorization,  // registered, waiting for the extension to be enabled in Roon
    Paired
};

std::string to_string(ClientStatus status);

/**
 * @brief WebSocket client for a Roon core
 *
 * Speaks MOO over ws://host:port/api: registers the extension, tracks pairing,
 * owns the transport:2 zone subscription and answers the core's ping and
 * settings requests. With no host configured the core is found with SOOD.
 * Everything runs on the Qt main loop.
 */
class RoonClient : public TransportClient {
public:
    using StatusCallback = std::function<void(ClientStatus)>;

    static constexpr std::string_view REGISTRY_SERVICE = "com.roonlabs.registry:1";
    static constexpr std::string_view TRANSPORT_SERVICE = "com.roonlabs.transport:2";
    static constexpr std::string_view PING_SERVICE = "com.roonlabs.ping:1";

    RoonClient(ExtensionInfo extension, PairingStore& pairing_store, SettingsProvider* settings_provider,
               ConnectionRetryConfig retry_config = {});
    ~RoonClient() override;

    RoonClient(const RoonClient&) = delete;
    RoonClient& operator=(const RoonClient&) = delete;

    // Empty host means discovery
    void start(const std::string& host, int port);
    void stop();

    // Drops the current socket and connects again right away
    void reconnect();

    void set_log_traffic(bool enabled) { m_log_traffic = enabled; }
    void set_status_callback(StatusCallback callback);

    ClientStatus status() const { return m_status; }
    bool is_paired() const { return m_connection.has_value(); }

    // TransportClient
    void set_paired_callback(PairingCallback callback) override;
    void set_unpaired_callback(PairingCallback callback) override;
    void subscribe_zones(ZoneEventCallback callback) override;
    void control(const std::string& zone_or_output_id, std::string_view command) override;

private:
    using ResponseHandler = std::function<void(const MooMessage&)>;

    void connect_to(const std::string& host, int port);
    void close_socket();
    void reset_session();
    void on_connected();
    void on_disconnected();
    void on_frame(const QByteArray& frame);

    std::uint64_t send_request(const std::string& name, const std::optional<nlohmann::json>& body,
                               ResponseHandler handler);
    void send_response(MooVerb verb, std::uint64_t request_id, const std::string& name,
                       const std::optional<nlohmann::json>& body);
    void send(const MooMessage& message);

    void handle_request(const MooMessage& request);
    void handle_response(const MooMessage& response);

    void request_info();
    void register_extension(const nlohmann::json& info);
    void on_registered(const nlohmann::json& body);
    void on_zone_message(const MooMessage& message);

    void schedule_reconnect();
    void attempt_reconnect();
    void set_status(ClientStatus status);

    ExtensionInfo m_extension;
    PairingStore& m_pairing_store;
    SettingsProvider* m_settings_provider;
    ConnectionRetryConfig m_retry_config;

    std::unique_ptr<QWebSocket> m_socket;
    std::unique_ptr<QTimer> m_reconnect_timer;
    SoodDiscovery m_discovery;

    std::string m_configured_host;
    int m_configured_port = 9100;
    std::string m_host;
    int m_port = 0;
    bool m_running = false;
    bool m_log_traffic = false;
    int m_consecutive_failures = 0;

    std::uint64_t m_next_request_id = 0;
    std::uint64_t m_next_subscription_key = 0;
    std::map<std::uint64_t, ResponseHandler> m_pending;

    std::optional<core::Connection> m_connection;
    ClientStatus m_status = ClientStatus::Stopped;

    std::optional<std::uint64_t> m_zone_request_id;
    std::uint64_t m_zone_subscription_key = 0;
    ZoneEventCallback m_zone_callback;

    PairingCallback m_on_paired;
    PairingCallback m_on_unpaired;
    StatusCallback m_on_status;
};

} // namespace roon_mpris::services

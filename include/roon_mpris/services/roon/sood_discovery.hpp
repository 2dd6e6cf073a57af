#pragma once

#include "roon_mpris/services/roon/sood.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

class QTimer;
class QUdpSocket;

namespace roon_mpris::services {

// Looks for Roon cores on the local network by sending SOOD queries to the
// multicast group and the IPv4 broadcast address. Lives on the Qt main loop.
class SoodDiscovery {
public:
    using CoreFoundCallback = std::function<void(const sood::CoreEndpoint&)>;

    explicit SoodDiscovery(std::chrono::milliseconds interval = std::chrono::seconds(10));
    ~SoodDiscovery();

    SoodDiscovery(const SoodDiscovery&) = delete;
    SoodDiscovery& operator=(const SoodDiscovery&) = delete;

    void set_core_found_callback(CoreFoundCallback callback);

    // Binds the socket and sends the first query immediately
    bool start();
    void stop();
    bool is_running() const;

private:
    void send_query();
    void read_datagrams();

    std::unique_ptr<QUdpSocket> m_socket;
    std::unique_ptr<QTimer> m_timer;
    std::chrono::milliseconds m_interval;
    CoreFoundCallback m_on_core_found;
    std::string m_transaction_id;
};

} // namespace roon_mpris::services
